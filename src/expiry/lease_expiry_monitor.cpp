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

#include "lease_expiry_monitor.h"

#include <vmlease/format.h>
#include <vmlease/logging/log.h>
#include <vmlease/top_catch_all.h>
#include <vmlease/utils.h>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
constexpr auto category = "expiry";

vl::NotificationEvent expiry_event(const vl::VMRecord& record)
{
    const auto name = record.name.empty() ? record.id : record.name;
    const auto expired_on = record.expiration_date->toString(Qt::ISODate);

    return {fmt::format("VM {}", name),
            vl::Outcome::warning,
            fmt::format("The lease of {} expired on {}", name, expired_on),
            {{"VM", name}, {"Expired", expired_on.toStdString()}},
            {vl::Audience::private_audience, record.owner_id}};
}
} // namespace

vl::LeaseExpiryMonitor::LeaseExpiryMonitor(VMRecordStore& store, NotificationSink& sink) : store{store}, sink{sink}
{
    QObject::connect(&timer, &QTimer::timeout, [this] {
        top_catch_all(category, [this] { check(); });
    });
}

int vl::LeaseExpiryMonitor::check()
{
    const auto now = VL_UTILS.current_date_time();
    auto notified = 0;

    for (const auto& record : store.all())
    {
        if (!record.expiration_date)
            continue;

        if (*record.expiration_date > now)
        {
            if (record.expiry_notified)
            {
                vll::info(category, "[{}] Lease renewed until {}", record.id, record.expiration_date->toString(Qt::ISODate));
                store.set_expiry_notified(record.id, false);
            }
            continue;
        }

        if (record.expiry_notified)
            continue;

        try
        {
            sink.notify(expiry_event(record));
        }
        catch (const std::exception& e)
        {
            vll::warn(category, "[{}] Could not deliver the expiry notification, will retry: {}", record.id, e.what());
            continue;
        }

        store.set_expiry_notified(record.id, true);
        ++notified;
    }

    vll::debug(category, "Expiry check done, {} notification(s) sent", notified);
    return notified;
}

void vl::LeaseExpiryMonitor::start(std::chrono::milliseconds interval)
{
    vll::info(category, "Checking lease expiry every {}s",
              std::chrono::duration_cast<std::chrono::seconds>(interval).count());
    timer.start(interval);
}

void vl::LeaseExpiryMonitor::stop()
{
    timer.stop();
}
