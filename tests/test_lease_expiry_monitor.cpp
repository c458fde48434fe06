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

#include "common.h"
#include "mock_logger.h"
#include "mock_notification_sink.h"
#include "mock_utils.h"
#include "mock_vm_record_store.h"
#include "temp_dir.h"

#include <src/expiry/lease_expiry_monitor.h>

#include <fmt/format.h>

#include <QEventLoop>
#include <QTimeZone>
#include <QTimer>

namespace vl = vmlease;
namespace vll = vmlease::logging;
namespace vlt = vmlease::test;
using namespace testing;
using namespace std::chrono_literals;

namespace
{
struct LeaseExpiryMonitor : public Test
{
    LeaseExpiryMonitor()
    {
        ON_CALL(*mock_utils, current_date_time()).WillByDefault(Return(now));
    }

    void add_vm(const std::string& id, std::optional<QDateTime> expiration, bool notified = false)
    {
        vl::VMRecord record;
        record.id = id;
        record.name = fmt::format("tenant-{}", id);
        record.vmx_path = fmt::format("/vms/{}/{}.vmx", id, id);
        record.owner_id = "owner-" + id;
        record.expiration_date = expiration;
        record.expiry_notified = notified;
        store.add(record);
    }

    const QDateTime now{QDate{2026, 3, 14}, QTime{12, 0}, QTimeZone::utc()};

    vlt::TempDir temp_dir;
    const QString records_path{temp_dir.filePath("vm-records.json")};
    vlt::MockLogger::Scope logger_scope = vlt::MockLogger::inject();
    const vlt::MockUtils::GuardedMock utils_injection = vlt::MockUtils::inject<NiceMock>();
    vlt::MockUtils* mock_utils = utils_injection.first;
    NiceMock<vlt::MockVMRecordStore> store{records_path};
    NiceMock<vlt::MockNotificationSink> sink;
    vl::LeaseExpiryMonitor monitor{store, sink};
};

TEST_F(LeaseExpiryMonitor, notifies_owner_of_expired_lease_once)
{
    add_vm("vm-1", now.addDays(-1));

    EXPECT_CALL(sink, notify(AllOf(vlt::has_outcome(vl::Outcome::warning),
                                   vlt::has_audience(vl::Audience::private_audience),
                                   Field(&vl::NotificationEvent::routing,
                                         Field(&vl::NotificationRouting::owner_id, Optional(std::string{"owner-vm-1"}))),
                                   Field(&vl::NotificationEvent::summary, HasSubstr("2026-03-13")),
                                   vlt::has_field("VM", "tenant-vm-1"))));
    EXPECT_CALL(store, set_expiry_notified("vm-1", true));

    EXPECT_EQ(monitor.check(), 1);
    EXPECT_EQ(monitor.check(), 0);

    EXPECT_TRUE(store.get("vm-1").expiry_notified);
}

TEST_F(LeaseExpiryMonitor, notifies_lease_expiring_exactly_now)
{
    add_vm("vm-1", now);

    EXPECT_CALL(sink, notify(_));

    EXPECT_EQ(monitor.check(), 1);
}

TEST_F(LeaseExpiryMonitor, ignores_active_and_open_ended_leases)
{
    add_vm("vm-1", now.addSecs(60));
    add_vm("vm-2", std::nullopt);

    EXPECT_CALL(sink, notify).Times(0);
    EXPECT_CALL(store, set_expiry_notified).Times(0);

    EXPECT_EQ(monitor.check(), 0);
}

TEST_F(LeaseExpiryMonitor, skips_leases_already_notified)
{
    add_vm("vm-1", now.addDays(-3), true);
    add_vm("vm-2", now.addDays(-2));

    EXPECT_CALL(sink, notify(vlt::has_field("VM", "tenant-vm-2")));

    EXPECT_EQ(monitor.check(), 1);
}

TEST_F(LeaseExpiryMonitor, clears_marker_when_lease_is_renewed)
{
    add_vm("vm-1", now.addDays(30), true);

    EXPECT_CALL(store, set_expiry_notified("vm-1", false));
    EXPECT_CALL(sink, notify).Times(0);

    EXPECT_EQ(monitor.check(), 0);
    EXPECT_FALSE(store.get("vm-1").expiry_notified);
}

TEST_F(LeaseExpiryMonitor, notifies_again_after_renewed_lease_expires)
{
    add_vm("vm-1", now.addDays(1), true);
    EXPECT_CALL(sink, notify(_));

    EXPECT_EQ(monitor.check(), 0);

    EXPECT_CALL(*mock_utils, current_date_time()).WillRepeatedly(Return(now.addDays(2)));
    EXPECT_EQ(monitor.check(), 1);
}

TEST_F(LeaseExpiryMonitor, retries_delivery_on_next_check)
{
    add_vm("vm-1", now.addDays(-1));
    logger_scope.mock_logger->screen_logs(vll::Level::error);
    logger_scope.mock_logger->expect_log(vll::Level::warning, "will retry");

    EXPECT_CALL(sink, notify(_)).WillOnce(Throw(std::runtime_error{"webhook returned 502"})).WillOnce(Return());

    EXPECT_EQ(monitor.check(), 0);
    EXPECT_FALSE(store.get("vm-1").expiry_notified);

    EXPECT_EQ(monitor.check(), 1);
    EXPECT_TRUE(store.get("vm-1").expiry_notified);
}

TEST_F(LeaseExpiryMonitor, does_not_notify_again_after_restart)
{
    add_vm("vm-1", now.addDays(-1));
    EXPECT_CALL(sink, notify(_)).Times(1);

    EXPECT_EQ(monitor.check(), 1);

    NiceMock<vlt::MockVMRecordStore> reloaded_store{records_path};
    vl::LeaseExpiryMonitor restarted_monitor{reloaded_store, sink};

    EXPECT_EQ(restarted_monitor.check(), 0);
}

TEST_F(LeaseExpiryMonitor, checks_periodically_once_started)
{
    add_vm("vm-1", now.addDays(-1));
    EXPECT_CALL(sink, notify(_)).Times(1);

    monitor.start(1ms);

    QEventLoop loop;
    QTimer::singleShot(100ms, &loop, &QEventLoop::quit);
    loop.exec();

    monitor.stop();
    EXPECT_TRUE(store.get("vm-1").expiry_notified);
}
} // namespace
