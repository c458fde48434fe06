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

#include "reinstall_launcher.h"

#include <vmlease/exceptions/record_store_exceptions.h>
#include <vmlease/logging/log.h>
#include <vmlease/top_catch_all.h>

#include <QtConcurrent/QtConcurrent>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
constexpr auto category = "launcher";
} // namespace

vl::ReinstallLauncher::ReinstallLauncher(VMRecordStore& store, ReinstallOrchestrator& orchestrator)
    : store{store}, orchestrator{orchestrator}
{
}

vl::ReinstallLauncher::~ReinstallLauncher()
{
    pool.waitForDone();
}

auto vl::ReinstallLauncher::begin(const std::string& vm_id) -> BeginResult
{
    if (!store.try_begin_task(vm_id, 0, "Reinstall queued"))
    {
        vll::info(category, "[{}] A task is already running, not starting another", vm_id);
        return BeginResult::already_running;
    }

    std::lock_guard<std::mutex> lock{mutex};
    try
    {
        auto future = QtConcurrent::run(&pool, [this, vm_id] {
            const ReinstallResult fallback{Outcome::failure, ReinstallStage::failed, "Reinstall aborted unexpectedly"};
            return top_catch_all(category, fallback, [this, &vm_id] { return orchestrator.run(vm_id); });
        });
        runs[vm_id] = Run{future, next_serial++};
    }
    catch (const std::exception& e)
    {
        vll::error(category, "[{}] Could not schedule the reinstall: {}", vm_id, e.what());
        store.update_task(vm_id, {TaskPhase::idle, 0, fmt::format("Could not schedule the reinstall: {}", e.what())});
        throw;
    }

    vll::debug(category, "[{}] Reinstall scheduled", vm_id);
    return BeginResult::accepted;
}

bool vl::ReinstallLauncher::is_active(const std::string& vm_id) const
{
    std::lock_guard<std::mutex> lock{mutex};
    auto it = runs.find(vm_id);
    return it != runs.end() && !it->second.future.isFinished();
}

auto vl::ReinstallLauncher::wait_for(const std::string& vm_id) -> std::optional<ReinstallResult>
{
    Run run;
    {
        std::lock_guard<std::mutex> lock{mutex};
        auto it = runs.find(vm_id);
        if (it == runs.end())
            return std::nullopt;

        run = it->second;
    }

    run.future.waitForFinished();
    auto result = run.future.result();

    std::lock_guard<std::mutex> lock{mutex};
    auto it = runs.find(vm_id);
    if (it != runs.end() && it->second.serial == run.serial) // a newer run may have replaced it meanwhile
        runs.erase(it);

    return result;
}
