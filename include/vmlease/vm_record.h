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

#ifndef VMLEASE_VM_RECORD_H
#define VMLEASE_VM_RECORD_H

#include <vmlease/constants.h>
#include <vmlease/guest_credentials.h>

#include <QDateTime>

#include <optional>
#include <string>
#include <string_view>

namespace vmlease
{
enum class TaskPhase
{
    idle,
    running,
    failed
};

constexpr std::string_view as_string(TaskPhase phase) noexcept
{
    switch (phase)
    {
    case TaskPhase::idle:
        return "idle";
    case TaskPhase::running:
        return "running";
    case TaskPhase::failed:
        return "failed";
    }
    return "unknown";
}

TaskPhase task_phase_from(std::string_view value);

struct TaskState
{
    TaskPhase phase{TaskPhase::idle};
    int progress{0};
    std::optional<std::string> message;

    bool operator==(const TaskState&) const = default;
};

struct NetworkIdentity
{
    std::string address;
    std::string hardware_id; // empty until the hardware address has been read from the VM

    bool operator==(const NetworkIdentity&) const = default;
};

struct RemoteAccessEndpoint
{
    std::string address{default_remote_access_address};
    int port{default_remote_access_port};
    std::string username{default_baseline_username};
};

struct RemoteDisplay
{
    bool enabled{false};
    int port{5900};
    std::optional<std::string> password;
};

struct VMRecord
{
    std::string id;
    std::string name;
    std::string vmx_path;
    std::string template_origin;
    std::optional<std::string> owner_id;
    std::optional<NetworkIdentity> network_identity;
    GuestCredentials guest_credentials;
    RemoteAccessEndpoint remote_access;
    RemoteDisplay remote_display;
    std::optional<QDateTime> expiration_date;
    bool expiry_notified{false};
    TaskState task;
};
} // namespace vmlease

#endif // VMLEASE_VM_RECORD_H
