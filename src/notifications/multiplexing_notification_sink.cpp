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

#include "multiplexing_notification_sink.h"

#include <vmlease/logging/log.h>

namespace vl = vmlease;
namespace vll = vmlease::logging;

vl::MultiplexingNotificationSink::MultiplexingNotificationSink(std::vector<NotificationSink::UPtr> sinks)
    : sinks{std::move(sinks)}
{
}

void vl::MultiplexingNotificationSink::add_sink(NotificationSink::UPtr sink)
{
    sinks.push_back(std::move(sink));
}

void vl::MultiplexingNotificationSink::notify(const NotificationEvent& event)
{
    for (const auto& sink : sinks)
    {
        try
        {
            sink->notify(event);
        }
        catch (const std::exception& e)
        {
            vll::error("notify", "Could not deliver \"{}\": {}", event.subject, e.what());
        }
    }
}
