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

#ifndef VMLEASE_VMRUN_VM_CONTROLLER_H
#define VMLEASE_VMRUN_VM_CONTROLLER_H

#include <vmlease/exceptions/vm_operation_exception.h>
#include <vmlease/process/process.h>
#include <vmlease/vm_controller.h>

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>

namespace vmlease
{
struct VmrunSettings
{
    QString vmrun_path{"vmrun"};
    QString host_type{"ws"};
    QString start_mode{"nogui"};
    int timeout_ms{600000};
};

// Classify a failed vmrun invocation from its exit state and output
VMOperationException vmrun_failure(const VmrunSettings& settings, const QString& command, const ProcessState& state,
                                   const QByteArray& standard_output, const QByteArray& standard_error);

// VMware's vmrun command line as a VMController. Hardware settings are edited in the .vmx file.
class VmrunVMController : public VMController
{
public:
    explicit VmrunVMController(const VmrunSettings& settings);

    bool is_running(const std::string& vm) override;
    void start(const std::string& vm) override;
    void stop(const std::string& vm, bool forced) override;
    void reset(const std::string& vm, bool forced) override;

    std::vector<std::string> list_snapshots(const std::string& vm) override;
    void create_snapshot(const std::string& vm, const std::string& name) override;
    void revert_snapshot(const std::string& vm, const std::string& name) override;
    void delete_snapshot(const std::string& vm, const std::string& name) override;

    void delete_vm(const std::string& vm) override;
    void clone(const std::string& source, const std::string& destination, const std::string& name, CloneMode mode,
               const std::string& base_snapshot) override;

    VMSpecs read_specs(const std::string& vm) override;
    void apply_specs(const std::string& vm, const VMSpecs& specs) override;
    void set_remote_display(const std::string& vm, int port, const std::optional<std::string>& password) override;

    std::string guest_ip(const std::string& vm, const std::optional<GuestCredentials>& credentials) override;
    void copy_to_guest(const std::string& vm, const std::string& host_path, const std::string& guest_path,
                       const GuestCredentials& credentials) override;
    void exec_in_guest(const std::string& vm, const std::string& program, const std::vector<std::string>& arguments,
                       const GuestCredentials& credentials, bool interactive) override;

private:
    QByteArray run(const QString& command, const QStringList& parameters,
                   const std::optional<GuestCredentials>& credentials = std::nullopt);

    const VmrunSettings settings;
};
} // namespace vmlease

#endif // VMLEASE_VMRUN_VM_CONTROLLER_H
