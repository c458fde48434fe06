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

#ifndef VMLEASE_GUEST_BOOTSTRAP_SCRIPT_H
#define VMLEASE_GUEST_BOOTSTRAP_SCRIPT_H

#include <string>

namespace vmlease
{
constexpr auto remote_access_firewall_rule = "vmlease Remote Desktop";

/**
 * PowerShell that enables Remote Desktop in a Windows guest and binds it to @p port.
 *
 * The script can be run any number of times against the same guest: the firewall rule is replaced
 * rather than added again, and the registry values are set, not toggled.
 *
 * @throws std::invalid_argument if @p port is not a valid TCP port
 */
std::string generate_bootstrap_script(int port);
} // namespace vmlease

#endif // VMLEASE_GUEST_BOOTSTRAP_SCRIPT_H
