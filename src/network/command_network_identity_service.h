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

#ifndef VMLEASE_COMMAND_NETWORK_IDENTITY_SERVICE_H
#define VMLEASE_COMMAND_NETWORK_IDENTITY_SERVICE_H

#include <vmlease/network_identity_service.h>

#include <QString>

namespace vmlease
{
// Delegates reservations to an external helper run as `<command> <vm_name> <hardware_id> <address>`
class CommandNetworkIdentityService : public NetworkIdentityService
{
public:
    CommandNetworkIdentityService(const QString& command, int timeout_ms = 30000);

    void reserve(const std::string& vm_name, const std::string& hardware_id, const std::string& address) override;

private:
    const QString command;
    const int timeout_ms;
};
} // namespace vmlease

#endif // VMLEASE_COMMAND_NETWORK_IDENTITY_SERVICE_H
