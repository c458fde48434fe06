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

#include "daemon.h"

#include <vmlease/format.h>
#include <vmlease/logging/log.h>
#include <vmlease/top_catch_all.h>
#include <vmlease/utils.h>

#include <QCoreApplication>

#include <fmt/format.h>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
constexpr auto category = "daemon";

std::string describe(const vl::TaskState& task)
{
    return fmt::format("{} {}%{}", vl::as_string(task.phase), task.progress, task.message ? ": " + *task.message : "");
}
} // namespace

vl::Daemon::Daemon(std::unique_ptr<const DaemonConfig> the_config)
    : config{std::move(the_config)},
      orchestrator{*config->record_store,
                   *config->vm_controller,
                   *config->network_identity_service,
                   *config->notification_sink,
                   config->reinstall_settings},
      launcher{*config->record_store, orchestrator},
      expiry_monitor{*config->record_store, *config->notification_sink}
{
}

int vl::Daemon::run(DaemonCommand command, const std::string& vm_id)
{
    switch (command)
    {
    case DaemonCommand::reinstall:
        return reinstall(vm_id);
    case DaemonCommand::status:
        return status(vm_id);
    case DaemonCommand::recover:
        return recover();
    case DaemonCommand::watch_expiry:
        return watch_expiry();
    }

    return ReturnCode::failed;
}

int vl::Daemon::reinstall(const std::string& vm_id)
{
    if (launcher.begin(vm_id) == ReinstallLauncher::BeginResult::already_running)
    {
        fmt::print("A task is already running on {}: {}\n", vm_id, describe(config->record_store->get(vm_id).task));
        return ReturnCode::busy;
    }

    std::optional<TaskState> last_reported;
    while (launcher.is_active(vm_id))
    {
        const auto task = config->record_store->get(vm_id).task;
        if (task != last_reported)
        {
            fmt::print("{}\n", describe(task));
            last_reported = task;
        }

        VL_UTILS.sleep_for(config->progress_poll_interval);
    }

    const auto result = launcher.wait_for(vm_id);
    if (!result)
        return ReturnCode::failed;

    fmt::print("Reinstall of {} finished ({}){}\n",
               vm_id,
               as_string(result->outcome),
               result->message ? ": " + *result->message : "");

    return result->outcome == Outcome::success ? ReturnCode::ok : ReturnCode::failed;
}

int vl::Daemon::status(const std::string& vm_id)
{
    const auto record = config->record_store->get(vm_id);

    fmt::print("{} ({})\n", record.name, record.id);
    fmt::print("  task: {}\n", describe(record.task));
    if (record.network_identity)
        fmt::print("  network identity: {} {}\n", record.network_identity->address, record.network_identity->hardware_id);
    fmt::print("  remote access: {}:{} as {}\n",
               record.remote_access.address,
               record.remote_access.port,
               record.remote_access.username);
    if (record.expiration_date)
        fmt::print("  lease expires: {}\n", record.expiration_date->toString(Qt::ISODate));

    return ReturnCode::ok;
}

int vl::Daemon::recover()
{
    const auto reset = config->record_store->reset_abandoned_tasks();
    for (const auto& id : reset)
        vll::warn(category, "[{}] Task abandoned by a previous process was reset", id);

    fmt::print("{} abandoned task(s) reset\n", reset.size());
    return ReturnCode::ok;
}

int vl::Daemon::watch_expiry()
{
    recover();

    top_catch_all(category, [this] { expiry_monitor.check(); });
    expiry_monitor.start(config->expiry_check_interval);

    return QCoreApplication::exec();
}
