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

#ifndef VMLEASE_VM_CONTROLLER_H
#define VMLEASE_VM_CONTROLLER_H

#include <vmlease/disabled_copy_move.h>
#include <vmlease/guest_credentials.h>
#include <vmlease/vm_specs.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vmlease
{
enum class CloneMode
{
    full,
    linked
};

constexpr std::string_view as_string(CloneMode mode) noexcept
{
    return mode == CloneMode::full ? "full" : "linked";
}

CloneMode clone_mode_from(const std::string& value);

/**
 * Control over the hypervisor and the guests it runs.
 *
 * Every call blocks until the hypervisor is done and throws VMOperationException, carrying an
 * ErrorKind, when it fails. VMs are addressed by their hypervisor handle (the .vmx path).
 */
class VMController : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<VMController>;

    virtual ~VMController() = default;

    // power
    virtual bool is_running(const std::string& vm) = 0;
    virtual void start(const std::string& vm) = 0;
    virtual void stop(const std::string& vm, bool forced) = 0;
    virtual void reset(const std::string& vm, bool forced) = 0;

    // snapshots
    virtual std::vector<std::string> list_snapshots(const std::string& vm) = 0;
    virtual void create_snapshot(const std::string& vm, const std::string& name) = 0;
    virtual void revert_snapshot(const std::string& vm, const std::string& name) = 0;
    virtual void delete_snapshot(const std::string& vm, const std::string& name) = 0;

    // lifecycle
    virtual void delete_vm(const std::string& vm) = 0;
    virtual void clone(const std::string& source, const std::string& destination, const std::string& name,
                       CloneMode mode, const std::string& base_snapshot) = 0;

    // hardware
    virtual VMSpecs read_specs(const std::string& vm) = 0;
    virtual void apply_specs(const std::string& vm, const VMSpecs& specs) = 0;
    virtual void set_remote_display(const std::string& vm, int port, const std::optional<std::string>& password) = 0;

    // guest
    virtual std::string guest_ip(const std::string& vm, const std::optional<GuestCredentials>& credentials) = 0;
    virtual void copy_to_guest(const std::string& vm, const std::string& host_path, const std::string& guest_path,
                               const GuestCredentials& credentials) = 0;
    virtual void exec_in_guest(const std::string& vm, const std::string& program,
                               const std::vector<std::string>& arguments, const GuestCredentials& credentials,
                               bool interactive) = 0;

protected:
    VMController() = default;
};
} // namespace vmlease

#endif // VMLEASE_VM_CONTROLLER_H
