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

#include "command_network_identity_service.h"

#include <vmlease/exceptions/reservation_exception.h>
#include <vmlease/format.h>
#include <vmlease/logging/log.h>
#include <vmlease/process/process.h>
#include <vmlease/process/process_factory.h>
#include <vmlease/utils.h>

#include <QRegularExpression>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
constexpr auto category = "network";

bool valid_hardware_address(const std::string& hardware_id)
{
    static const QRegularExpression mac_re{"^([0-9a-fA-F]{2}:){5}[0-9a-fA-F]{2}$"};
    return mac_re.match(QString::fromStdString(hardware_id)).hasMatch();
}
} // namespace

vl::CommandNetworkIdentityService::CommandNetworkIdentityService(const QString& command, int timeout_ms)
    : command{command}, timeout_ms{timeout_ms}
{
}

void vl::CommandNetworkIdentityService::reserve(const std::string& vm_name, const std::string& hardware_id,
                                                const std::string& address)
{
    if (command.isEmpty())
        throw ReservationException{"No reservation command is configured"};

    if (!valid_hardware_address(hardware_id))
        throw ReservationException{"Invalid hardware address \"{}\" for {}", hardware_id, vm_name};

    if (!VL_UTILS.is_ipv4_valid(address))
        throw ReservationException{"Invalid address \"{}\" for {}", address, vm_name};

    vll::info(category, "Reserving {} for {} ({})", address, vm_name, hardware_id);

    auto process = VL_PROCFACTORY.create_process(
        command,
        {QString::fromStdString(vm_name), QString::fromStdString(hardware_id), QString::fromStdString(address)});
    const auto state = process->execute(timeout_ms);

    if (!state.completed_successfully())
    {
        auto output = process->read_all_standard_error().trimmed();
        if (output.isEmpty())
            output = process->read_all_standard_output().trimmed();

        throw ReservationException{"Could not reserve {} for {} ({}): {}", address, vm_name, state.failure_message(),
                                   output.isEmpty() ? QByteArray{"no output"} : output};
    }
}
