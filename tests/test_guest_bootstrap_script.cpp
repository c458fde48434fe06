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

#include <src/reinstall/guest_bootstrap_script.h>

namespace vl = vmlease;
using namespace testing;

namespace
{
TEST(GuestBootstrapScript, stops_on_first_error)
{
    EXPECT_THAT(vl::generate_bootstrap_script(3389), StartsWith("$ErrorActionPreference = 'Stop'"));
}

TEST(GuestBootstrapScript, enables_remote_desktop_on_requested_port)
{
    const auto script = vl::generate_bootstrap_script(3390);

    EXPECT_THAT(script, HasSubstr("$port = 3390\n"));
    EXPECT_THAT(script, HasSubstr("-Name 'fDenyTSConnections' -Value 0"));
    EXPECT_THAT(script, HasSubstr("WinStations\\RDP-Tcp\" -Name 'PortNumber' -Value $port"));
}

TEST(GuestBootstrapScript, replaces_firewall_rule_for_tcp_and_udp)
{
    const auto script = vl::generate_bootstrap_script(3390);

    EXPECT_THAT(script, HasSubstr(fmt::format("$ruleName = '{}'", vl::remote_access_firewall_rule)));

    const auto removal = script.find("Remove-NetFirewallRule");
    const auto tcp = script.find("-Protocol TCP -LocalPort $port -Action Allow");
    const auto udp = script.find("-Protocol UDP -LocalPort $port -Action Allow");
    ASSERT_NE(removal, std::string::npos);
    ASSERT_NE(tcp, std::string::npos);
    ASSERT_NE(udp, std::string::npos);
    EXPECT_LT(removal, tcp);
    EXPECT_LT(removal, udp);
}

TEST(GuestBootstrapScript, restarts_remote_desktop_service_last)
{
    EXPECT_THAT(vl::generate_bootstrap_script(3389), EndsWith("Restart-Service -Name TermService -Force\n"));
}

TEST(GuestBootstrapScript, rejects_invalid_ports)
{
    EXPECT_THROW(vl::generate_bootstrap_script(0), std::invalid_argument);
    EXPECT_THROW(vl::generate_bootstrap_script(65536), std::invalid_argument);
    EXPECT_NO_THROW(vl::generate_bootstrap_script(65535));
}
} // namespace
