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
#include "mock_process_factory.h"

#include <src/network/command_network_identity_service.h>

#include <vmlease/exceptions/reservation_exception.h>

namespace vl = vmlease;
namespace vll = vmlease::logging;
namespace vlt = vmlease::test;
using namespace testing;

namespace
{
struct CommandNetworkIdentityService : public Test
{
    std::unique_ptr<vlt::MockProcessFactory::Scope> process_factory = vlt::MockProcessFactory::Inject();
    vlt::MockLogger::Scope logger_scope = vlt::MockLogger::inject();
    vl::CommandNetworkIdentityService service{"/usr/local/sbin/vmlease-reserve", 2000};
};

TEST_F(CommandNetworkIdentityService, runs_helper_with_vm_hardware_id_and_address)
{
    logger_scope.mock_logger->screen_logs(vll::Level::error);
    logger_scope.mock_logger->expect_log(vll::Level::info, "Reserving 192.168.119.50 for tenant-vm");
    process_factory->register_callback([](vlt::MockProcess* process) {
        vl::ProcessState success;
        success.exit_code = 0;
        EXPECT_CALL(*process, execute(2000)).WillOnce(Return(success));
    });

    service.reserve("tenant-vm", "00:50:56:3a:7b:01", "192.168.119.50");

    const auto processes = process_factory->process_list();
    ASSERT_EQ(processes.size(), 1u);
    EXPECT_EQ(processes.front().command, "/usr/local/sbin/vmlease-reserve");
    EXPECT_EQ(processes.front().arguments, (QStringList{"tenant-vm", "00:50:56:3a:7b:01", "192.168.119.50"}));
}

TEST_F(CommandNetworkIdentityService, reports_helper_failure_with_its_output)
{
    process_factory->register_callback([](vlt::MockProcess* process) {
        vl::ProcessState failure;
        failure.exit_code = 3;
        ON_CALL(*process, execute(_)).WillByDefault(Return(failure));
        ON_CALL(*process, read_all_standard_error()).WillByDefault(Return("dhcpd.conf: permission denied\n"));
    });

    VL_EXPECT_THROW_THAT(service.reserve("tenant-vm", "00:50:56:3a:7b:01", "192.168.119.50"),
                         vl::ReservationException,
                         vlt::match_what(AllOf(HasSubstr("exit code 3"), HasSubstr("dhcpd.conf: permission denied"))));
}

TEST_F(CommandNetworkIdentityService, falls_back_to_standard_output_in_failure_report)
{
    process_factory->register_callback([](vlt::MockProcess* process) {
        vl::ProcessState failure;
        failure.exit_code = 1;
        ON_CALL(*process, execute(_)).WillByDefault(Return(failure));
        ON_CALL(*process, read_all_standard_output()).WillByDefault(Return("host entry exists"));
    });

    VL_EXPECT_THROW_THAT(service.reserve("tenant-vm", "00:50:56:3a:7b:01", "192.168.119.50"),
                         vl::ReservationException,
                         vlt::match_what(HasSubstr("host entry exists")));
}

TEST_F(CommandNetworkIdentityService, validates_hardware_address)
{
    VL_EXPECT_THROW_THAT(service.reserve("tenant-vm", "00:50:56:3a:7b", "192.168.119.50"),
                         vl::ReservationException,
                         vlt::match_what(HasSubstr("Invalid hardware address")));
    EXPECT_THROW(service.reserve("tenant-vm", "", "192.168.119.50"), vl::ReservationException);

    EXPECT_TRUE(process_factory->process_list().empty());
}

TEST_F(CommandNetworkIdentityService, validates_address)
{
    VL_EXPECT_THROW_THAT(service.reserve("tenant-vm", "00:50:56:3a:7b:01", "192.168.300.1"),
                         vl::ReservationException,
                         vlt::match_what(HasSubstr("Invalid address")));

    EXPECT_TRUE(process_factory->process_list().empty());
}

TEST_F(CommandNetworkIdentityService, requires_a_command)
{
    vl::CommandNetworkIdentityService unconfigured{""};

    VL_EXPECT_THROW_THAT(unconfigured.reserve("tenant-vm", "00:50:56:3a:7b:01", "192.168.119.50"),
                         vl::ReservationException,
                         vlt::match_what(HasSubstr("No reservation command")));
}
} // namespace
