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

#ifndef VMLEASE_NETWORK_IDENTITY_SERVICE_H
#define VMLEASE_NETWORK_IDENTITY_SERVICE_H

#include <vmlease/disabled_copy_move.h>

#include <memory>
#include <string>

namespace vmlease
{
// Host-side mapping from a VM's hardware address to its reserved IP address
class NetworkIdentityService : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<NetworkIdentityService>;

    virtual ~NetworkIdentityService() = default;

    // Create or replace the reservation for vm_name. Throws ReservationException.
    virtual void reserve(const std::string& vm_name, const std::string& hardware_id, const std::string& address) = 0;

protected:
    NetworkIdentityService() = default;
};
} // namespace vmlease

#endif // VMLEASE_NETWORK_IDENTITY_SERVICE_H
