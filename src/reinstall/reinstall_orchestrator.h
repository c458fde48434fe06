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

#ifndef VMLEASE_REINSTALL_ORCHESTRATOR_H
#define VMLEASE_REINSTALL_ORCHESTRATOR_H

#include <vmlease/constants.h>
#include <vmlease/disabled_copy_move.h>
#include <vmlease/guest_credentials.h>
#include <vmlease/network_identity_service.h>
#include <vmlease/notification.h>
#include <vmlease/notification_sink.h>
#include <vmlease/vm_controller.h>
#include <vmlease/vm_record_store.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vmlease
{
struct StaticAddressing
{
    std::string interface_name{"Ethernet0"};
    std::string gateway{default_gateway};
    std::string subnet_mask{default_subnet_mask};
    std::vector<std::string> dns_servers{"1.1.1.1", "1.0.0.1"};
};

struct ReinstallSettings
{
    std::string baseline_snapshot{default_baseline_snapshot};
    GuestCredentials baseline_credentials{default_baseline_username, ""};

    std::string template_path;
    std::string template_snapshot{default_baseline_snapshot};
    CloneMode clone_mode{CloneMode::linked};

    int guest_ip_attempts{default_guest_ip_attempts};
    std::chrono::milliseconds guest_ip_interval{default_guest_ip_interval};
    std::chrono::milliseconds stop_settle_delay{default_stop_settle_delay};

    std::string guest_script_path{default_guest_script_path};
    StaticAddressing static_addressing;
};

enum class ReinstallStage
{
    init,
    stopping,
    restoring,
    networking,
    booting,
    waiting_for_guest,
    bootstrapping,
    finalizing,
    done,
    failed
};

constexpr std::string_view as_string(ReinstallStage stage) noexcept
{
    switch (stage)
    {
    case ReinstallStage::init:
        return "init";
    case ReinstallStage::stopping:
        return "stopping";
    case ReinstallStage::restoring:
        return "restoring";
    case ReinstallStage::networking:
        return "networking";
    case ReinstallStage::booting:
        return "booting";
    case ReinstallStage::waiting_for_guest:
        return "waiting_for_guest";
    case ReinstallStage::bootstrapping:
        return "bootstrapping";
    case ReinstallStage::finalizing:
        return "finalizing";
    case ReinstallStage::done:
        return "done";
    case ReinstallStage::failed:
        return "failed";
    }
    return "unknown";
}

struct ReinstallResult
{
    Outcome outcome{Outcome::failure};
    ReinstallStage last_stage{ReinstallStage::init}; // the stage that was running when the run ended
    std::optional<std::string> message;
};

/**
 * Wipes one VM back to its baseline and brings it up again for its tenant.
 *
 * The caller must hold the VM's task lease (see VMRecordStore::try_begin_task). The lease is
 * handed back, with the task set to idle, on every way out of run().
 */
class ReinstallOrchestrator : private DisabledCopyMove
{
public:
    ReinstallOrchestrator(VMRecordStore& store,
                          VMController& controller,
                          NetworkIdentityService& network,
                          NotificationSink& sink,
                          ReinstallSettings settings);

    // Fatal errors are reported in the result and through the notification sink, never thrown
    ReinstallResult run(const std::string& vm_id);

    const ReinstallSettings& settings() const noexcept;

private:
    VMRecordStore& store;
    VMController& controller;
    NetworkIdentityService& network;
    NotificationSink& sink;
    const ReinstallSettings reinstall_settings;
};
} // namespace vmlease

#endif // VMLEASE_REINSTALL_ORCHESTRATOR_H
