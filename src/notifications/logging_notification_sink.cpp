/*
 * Copyright (C) Canonical, Ltd.
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; version 3.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "logging_notification_sink.h"

#include <vmlease/format.h>
#include <vmlease/logging/log.h>

#include <QString>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
constexpr auto category = "notify";

vll::Level level_for(vl::Outcome outcome)
{
    switch (outcome)
    {
    case vl::Outcome::failure:
        return vll::Level::error;
    case vl::Outcome::warning:
        return vll::Level::warning;
    case vl::Outcome::started:
    case vl::Outcome::success:
        return vll::Level::info;
    }
    return vll::Level::info;
}

bool is_secret(const std::string& field_name)
{
    return QString::fromStdString(field_name).contains("password", Qt::CaseInsensitive);
}
} // namespace

void vl::LoggingNotificationSink::notify(const NotificationEvent& event)
{
    std::vector<std::string> fields;
    for (const auto& field : event.fields)
        fields.push_back(fmt::format("{}={}", field.name, is_secret(field.name) ? "******" : field.value));

    vll::log(level_for(event.outcome),
             category,
             fmt::format("[{}{}] {}: {} {}",
                         as_string(event.routing.audience),
                         event.routing.owner_id ? fmt::format(" owner {}", *event.routing.owner_id) : "",
                         event.subject,
                         event.summary,
                         fmt::join(fields, ", ")));
}
