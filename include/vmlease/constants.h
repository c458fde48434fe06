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

#ifndef VMLEASE_CONSTANTS_H
#define VMLEASE_CONSTANTS_H

#include <chrono>

using namespace std::chrono_literals;

namespace vmlease
{
constexpr auto daemon_name = "vmleased";
constexpr auto version_string = "0.4.0";

constexpr auto default_baseline_snapshot = "Base-v2";
constexpr auto default_baseline_username = "Administrator";
constexpr auto default_guest_script_path = "C:\\Windows\\Temp\\vmlease-bootstrap.ps1";

constexpr auto default_guest_ip_attempts = 60;
constexpr auto default_guest_ip_interval = 5s;
constexpr auto default_stop_settle_delay = 3s;
constexpr auto default_vmrun_timeout = std::chrono::milliseconds{10min};
constexpr auto default_expiry_check_interval = 1h;

constexpr auto default_remote_access_address = "remotedesktop.penguinhosting.host";
constexpr auto default_remote_access_port = 3389;

constexpr auto default_gateway = "192.168.119.2";
constexpr auto default_subnet_mask = "255.255.255.0";
constexpr auto default_dns_servers = "1.1.1.1,1.0.0.1";

constexpr auto default_records_file = "vm-records.json";

constexpr auto max_vnc_password_length = 8; // VMware truncates longer VNC passwords
} // namespace vmlease

#endif // VMLEASE_CONSTANTS_H
