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

#include "guest_bootstrap_script.h"

#include <fmt/format.h>

#include <stdexcept>

namespace vl = vmlease;

std::string vl::generate_bootstrap_script(int port)
{
    if (port < 1 || port > 65535)
        throw std::invalid_argument{fmt::format("Invalid remote access port: {}", port)};

    return fmt::format(R"ps($ErrorActionPreference = 'Stop'

$port = {0}
$ruleName = '{1}'
$terminalServer = 'HKLM:\System\CurrentControlSet\Control\Terminal Server'

Set-ItemProperty -Path $terminalServer -Name 'fDenyTSConnections' -Value 0
Set-ItemProperty -Path "$terminalServer\WinStations\RDP-Tcp" -Name 'PortNumber' -Value $port

Get-NetFirewallRule -DisplayName $ruleName -ErrorAction SilentlyContinue | Remove-NetFirewallRule
New-NetFirewallRule -DisplayName $ruleName -Direction Inbound -Protocol TCP -LocalPort $port -Action Allow | Out-Null
New-NetFirewallRule -DisplayName $ruleName -Direction Inbound -Protocol UDP -LocalPort $port -Action Allow | Out-Null

Restart-Service -Name TermService -Force
)ps",
                       port,
                       remote_access_firewall_rule);
}
