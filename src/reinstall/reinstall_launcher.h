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

#ifndef VMLEASE_REINSTALL_LAUNCHER_H
#define VMLEASE_REINSTALL_LAUNCHER_H

#include "reinstall_orchestrator.h"

#include <vmlease/disabled_copy_move.h>
#include <vmlease/vm_record_store.h>

#include <QFuture>
#include <QThreadPool>

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vmlease
{
/**
 * Starts reinstalls in the background, at most one per VM.
 *
 * A VM is busy while its task is not idle. The lease is taken from the record store before anything
 * is scheduled, so a second begin() for the same VM is refused, including one from another process
 * sharing the same records file.
 */
class ReinstallLauncher : private DisabledCopyMove
{
public:
    enum class BeginResult
    {
        accepted,
        already_running
    };

    ReinstallLauncher(VMRecordStore& store, ReinstallOrchestrator& orchestrator);
    ~ReinstallLauncher(); // waits for the runs still in flight

    // Throws NoSuchVMException for unknown ids
    BeginResult begin(const std::string& vm_id);

    // Whether a run started by this launcher is still in flight for the VM
    bool is_active(const std::string& vm_id) const;

    // Block until the VM's run ends and hand over its result, which is then forgotten. Empty if this
    // launcher has no uncollected run for the VM.
    std::optional<ReinstallResult> wait_for(const std::string& vm_id);

private:
    struct Run
    {
        QFuture<ReinstallResult> future;
        unsigned long serial{0};
    };

    VMRecordStore& store;
    ReinstallOrchestrator& orchestrator;
    QThreadPool pool;
    mutable std::mutex mutex;
    std::unordered_map<std::string, Run> runs;
    unsigned long next_serial{0};
};
} // namespace vmlease

#endif // VMLEASE_REINSTALL_LAUNCHER_H
