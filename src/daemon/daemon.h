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

#ifndef VMLEASE_DAEMON_H
#define VMLEASE_DAEMON_H

#include "daemon_config.h"

#include <src/expiry/lease_expiry_monitor.h>
#include <src/reinstall/reinstall_launcher.h>
#include <src/reinstall/reinstall_orchestrator.h>

#include <vmlease/disabled_copy_move.h>

#include <memory>
#include <string>

namespace vmlease
{
enum class DaemonCommand
{
    reinstall,
    status,
    recover,
    watch_expiry
};

struct ReturnCode
{
    static constexpr int ok = 0;
    static constexpr int failed = 1; // includes runs that completed with a warning
    static constexpr int busy = 2;
};

class Daemon : private DisabledCopyMove
{
public:
    explicit Daemon(std::unique_ptr<const DaemonConfig> config);

    int run(DaemonCommand command, const std::string& vm_id);

    // Begin a reinstall and report its progress until it ends
    int reinstall(const std::string& vm_id);
    int status(const std::string& vm_id);
    // Hand back the tasks a previous process left running
    int recover();
    // Check lease expiry periodically until the application quits
    int watch_expiry();

private:
    std::unique_ptr<const DaemonConfig> config;
    ReinstallOrchestrator orchestrator;
    ReinstallLauncher launcher;
    LeaseExpiryMonitor expiry_monitor;
};
} // namespace vmlease

#endif // VMLEASE_DAEMON_H
