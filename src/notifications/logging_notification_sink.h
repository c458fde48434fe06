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

#ifndef VMLEASE_LOGGING_NOTIFICATION_SINK_H
#define VMLEASE_LOGGING_NOTIFICATION_SINK_H

#include <vmlease/notification_sink.h>

namespace vmlease
{
// Writes events to the log. Field values that look like secrets are masked.
class LoggingNotificationSink : public NotificationSink
{
public:
    void notify(const NotificationEvent& event) override;
};
} // namespace vmlease

#endif // VMLEASE_LOGGING_NOTIFICATION_SINK_H
