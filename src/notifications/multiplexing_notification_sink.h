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

#ifndef VMLEASE_MULTIPLEXING_NOTIFICATION_SINK_H
#define VMLEASE_MULTIPLEXING_NOTIFICATION_SINK_H

#include <vmlease/notification_sink.h>

#include <vector>

namespace vmlease
{
// Fans each event out to every attached sink. A failing sink does not stop delivery to the others.
class MultiplexingNotificationSink : public NotificationSink
{
public:
    MultiplexingNotificationSink() = default;
    explicit MultiplexingNotificationSink(std::vector<NotificationSink::UPtr> sinks);

    void add_sink(NotificationSink::UPtr sink);
    void notify(const NotificationEvent& event) override;

private:
    std::vector<NotificationSink::UPtr> sinks;
};
} // namespace vmlease

#endif // VMLEASE_MULTIPLEXING_NOTIFICATION_SINK_H
