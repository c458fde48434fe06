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

#ifndef VMLEASE_LEASE_EXPIRY_MONITOR_H
#define VMLEASE_LEASE_EXPIRY_MONITOR_H

#include <vmlease/disabled_copy_move.h>
#include <vmlease/notification_sink.h>
#include <vmlease/vm_record_store.h>

#include <QTimer>

#include <chrono>

namespace vmlease
{
/**
 * Tells tenants once when their lease has run out.
 *
 * The "already told" marker lives in the VM record, so restarts do not repeat a notification.
 * Moving the expiration date into the future clears it again.
 */
class LeaseExpiryMonitor : private DisabledCopyMove
{
public:
    LeaseExpiryMonitor(VMRecordStore& store, NotificationSink& sink);

    // One pass over every record. Returns the number of expiry notifications delivered.
    int check();

    // Run check() every interval on the calling thread's event loop
    void start(std::chrono::milliseconds interval);
    void stop();

private:
    VMRecordStore& store;
    NotificationSink& sink;
    QTimer timer;
};
} // namespace vmlease

#endif // VMLEASE_LEASE_EXPIRY_MONITOR_H
