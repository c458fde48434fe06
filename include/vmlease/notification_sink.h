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

#ifndef VMLEASE_NOTIFICATION_SINK_H
#define VMLEASE_NOTIFICATION_SINK_H

#include <vmlease/disabled_copy_move.h>
#include <vmlease/notification.h>

#include <memory>

namespace vmlease
{
class NotificationSink : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<NotificationSink>;

    virtual ~NotificationSink() = default;

    // Deliver the event to whatever destinations its routing resolves to. May throw.
    virtual void notify(const NotificationEvent& event) = 0;

protected:
    NotificationSink() = default;
};
} // namespace vmlease

#endif // VMLEASE_NOTIFICATION_SINK_H
