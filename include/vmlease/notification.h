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

#ifndef VMLEASE_NOTIFICATION_H
#define VMLEASE_NOTIFICATION_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vmlease
{
enum class Outcome
{
    started,
    success,
    warning,
    failure
};

// Public events go to the tenant's shared channel, private ones to the tenant and operators only
enum class Audience
{
    public_audience,
    private_audience
};

struct NotificationField
{
    std::string name;
    std::string value;
    bool is_inline{true};
};

struct NotificationRouting
{
    Audience audience{Audience::private_audience};
    std::optional<std::string> owner_id;
};

struct NotificationEvent
{
    std::string subject;
    Outcome outcome;
    std::string summary;
    std::vector<NotificationField> fields;
    NotificationRouting routing;
};

constexpr std::string_view as_string(Outcome outcome) noexcept
{
    switch (outcome)
    {
    case Outcome::started:
        return "started";
    case Outcome::success:
        return "success";
    case Outcome::warning:
        return "warning";
    case Outcome::failure:
        return "failure";
    }
    return "unknown";
}

constexpr std::string_view as_string(Audience audience) noexcept
{
    return audience == Audience::public_audience ? "public" : "private";
}

// RGB color a sink may use to render the outcome
constexpr std::uint32_t outcome_color(Outcome outcome) noexcept
{
    switch (outcome)
    {
    case Outcome::started:
        return 0x3498db;
    case Outcome::success:
        return 0x2ecc71;
    case Outcome::warning:
        return 0xf39c12;
    case Outcome::failure:
        return 0xe74c3c;
    }
    return 0x95a5a6;
}
} // namespace vmlease

#endif // VMLEASE_NOTIFICATION_H
