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

#include "vmrun_vm_controller.h"
#include "vmx_file.h"

#include <vmlease/constants.h>
#include <vmlease/format.h>
#include <vmlease/logging/log.h>
#include <vmlease/process/process_factory.h>
#include <vmlease/process/process_spec.h>
#include <vmlease/utils.h>

#include <QDir>

#include <algorithm>

namespace vl = vmlease;
namespace vll = vmlease::logging;
namespace vlu = vmlease::utils;

namespace
{
constexpr auto category = "vmrun";
constexpr auto redacted = "******";

// vmrun prints errors on stdout, prefixed with "Error: "
const std::vector<std::pair<QString, vl::ErrorKind>> known_failures{
    {"Invalid user name or password", vl::ErrorKind::auth_rejected},
    {"Anonymous guest operations are not allowed", vl::ErrorKind::auth_rejected},
    {"The VMware Tools are not running", vl::ErrorKind::not_ready},
    {"Unable to get the IP address", vl::ErrorKind::not_ready},
    {"The virtual machine is not powered on", vl::ErrorKind::not_ready},
    {"Unable to connect to host", vl::ErrorKind::unavailable},
    {"Cannot connect to the virtual machine", vl::ErrorKind::unavailable}};

class VmrunProcessSpec : public vl::ProcessSpec
{
public:
    VmrunProcessSpec(const vl::VmrunSettings& settings, const QString& command, const QStringList& parameters,
                     const std::optional<vl::GuestCredentials>& credentials)
        : vmrun_path{settings.vmrun_path}
    {
        args << "-T" << settings.host_type;
        if (credentials)
            args << "-gu" << QString::fromStdString(credentials->username) << "-gp"
                 << QString::fromStdString(credentials->password);
        args << command << parameters;
    }

    QString program() const override
    {
        return vmrun_path;
    }

    QStringList arguments() const override
    {
        return args;
    }

    QStringList loggable_arguments() const override
    {
        auto masked = args;
        const auto password_index = masked.indexOf("-gp") + 1;
        if (password_index > 0 && password_index < masked.size())
            masked[password_index] = redacted;

        return masked;
    }

private:
    const QString vmrun_path;
    QStringList args;
};

// vmrun reports paths with the host's separators, which need not be ours
QString normalized(const QString& path)
{
    return QDir::cleanPath(path.trimmed().replace('\\', '/')).toLower();
}

QString qstr(const std::string& s)
{
    return QString::fromStdString(s);
}
} // namespace

vl::VMOperationException vl::vmrun_failure(const VmrunSettings& settings, const QString& command,
                                           const ProcessState& state, const QByteArray& standard_output,
                                           const QByteArray& standard_error)
{
    if (state.error && state.error->state == QProcess::FailedToStart)
        return VMOperationException{ErrorKind::unavailable, "vmrun executable not found at {}", settings.vmrun_path};

    if (state.error && state.error->state == QProcess::Timedout)
        return VMOperationException{ErrorKind::unavailable, "VM Operation Failed: vmrun {} timed out after {} ms",
                                    command, settings.timeout_ms};

    auto detail = QString::fromUtf8(standard_error).trimmed();
    if (detail.isEmpty())
        detail = QString::fromUtf8(standard_output).trimmed();
    if (detail.isEmpty())
        detail = state.error ? state.error->message : QString{"Unknown error"};

    auto kind = ErrorKind::unknown;
    for (const auto& [text, failure_kind] : known_failures)
    {
        if (detail.contains(text, Qt::CaseInsensitive))
        {
            kind = failure_kind;
            break;
        }
    }

    return VMOperationException{kind, "VM Operation Failed: {}", detail};
}

vl::VmrunVMController::VmrunVMController(const VmrunSettings& settings) : settings{settings}
{
}

QByteArray vl::VmrunVMController::run(const QString& command, const QStringList& parameters,
                                      const std::optional<GuestCredentials>& credentials)
{
    auto spec = std::make_unique<VmrunProcessSpec>(settings, command, parameters, credentials);
    vll::info(category, "Executing: {} {}", spec->program(), spec->loggable_arguments());

    auto process = VL_PROCFACTORY.create_process(std::move(spec));
    const auto state = process->execute(settings.timeout_ms);
    const auto output = process->read_all_standard_output();

    if (!state.completed_successfully())
    {
        const auto error = process->read_all_standard_error();
        vll::error(category, "Error running vmrun {}: {}", command,
                   error.isEmpty() ? QString::fromStdString(state.failure_message()) : QString::fromUtf8(error));
        if (!output.isEmpty())
            vll::error(category, "Stdout: {}", output.trimmed());

        throw vmrun_failure(settings, command, state, output, error);
    }

    return output.trimmed();
}

bool vl::VmrunVMController::is_running(const std::string& vm)
{
    // First line is "Total running VMs: N", one .vmx path per line follows
    auto lines = vlu::split_lines(run("list", {}));
    if (!lines.isEmpty())
        lines.removeFirst();

    const auto target = normalized(qstr(vm));
    return std::any_of(lines.cbegin(), lines.cend(), [&target](const QString& line) {
        return normalized(line) == target;
    });
}

void vl::VmrunVMController::start(const std::string& vm)
{
    run("start", {qstr(vm), settings.start_mode});
}

void vl::VmrunVMController::stop(const std::string& vm, bool forced)
{
    run("stop", {qstr(vm), forced ? "hard" : "soft"});
}

void vl::VmrunVMController::reset(const std::string& vm, bool forced)
{
    run("reset", {qstr(vm), forced ? "hard" : "soft"});
}

std::vector<std::string> vl::VmrunVMController::list_snapshots(const std::string& vm)
{
    // First line is "Total snapshots: N"
    auto lines = vlu::split_lines(run("listSnapshots", {qstr(vm)}));
    if (!lines.isEmpty())
        lines.removeFirst();

    std::vector<std::string> snapshots;
    for (const auto& line : lines)
        snapshots.push_back(line.toStdString());

    return snapshots;
}

void vl::VmrunVMController::create_snapshot(const std::string& vm, const std::string& name)
{
    run("snapshot", {qstr(vm), qstr(name)});
}

void vl::VmrunVMController::revert_snapshot(const std::string& vm, const std::string& name)
{
    run("revertToSnapshot", {qstr(vm), qstr(name)});
}

void vl::VmrunVMController::delete_snapshot(const std::string& vm, const std::string& name)
{
    run("deleteSnapshot", {qstr(vm), qstr(name)});
}

void vl::VmrunVMController::delete_vm(const std::string& vm)
{
    run("deleteVM", {qstr(vm)});
}

void vl::VmrunVMController::clone(const std::string& source, const std::string& destination,
                                  const std::string& name, CloneMode mode, const std::string& base_snapshot)
{
    const auto mode_name = as_string(mode);
    QStringList parameters{qstr(source), qstr(destination),
                           QString::fromUtf8(mode_name.data(), static_cast<qsizetype>(mode_name.size()))};
    if (!base_snapshot.empty())
        parameters << QString{"-snapshot=%1"}.arg(qstr(base_snapshot));
    if (!name.empty())
        parameters << QString{"-cloneName=%1"}.arg(qstr(name));

    run("clone", parameters);
}

vl::VMSpecs vl::VmrunVMController::read_specs(const std::string& vm)
{
    const auto vmx = VmxFile::load(qstr(vm));

    bool ok = false;
    const auto memory_mb = vmx.value("memsize").value_or("").toInt(&ok);
    if (!ok || memory_mb <= 0)
        throw VMOperationException{ErrorKind::unknown, "Could not read memory size of {}", vm};

    const auto cpu_count = vmx.value("numvcpus").value_or("1").toInt(&ok);
    if (!ok || cpu_count <= 0)
        throw VMOperationException{ErrorKind::unknown, "Could not read CPU count of {}", vm};

    VMSpecs specs{cpu_count, memory_mb, std::nullopt};
    auto address = vmx.value("ethernet0.address");
    if (!address || address->isEmpty())
        address = vmx.value("ethernet0.generatedAddress");
    if (address && !address->isEmpty())
        specs.hardware_address = address->toLower().toStdString();

    vll::debug(category, "Read specs of {}: {} CPUs, {} MB", vm, specs.cpu_count, specs.memory_mb);
    return specs;
}

void vl::VmrunVMController::apply_specs(const std::string& vm, const VMSpecs& specs)
{
    auto vmx = VmxFile::load(qstr(vm));
    vmx.set("numvcpus", QString::number(specs.cpu_count));
    vmx.set("memsize", QString::number(specs.memory_mb));

    if (specs.hardware_address)
    {
        vmx.set("ethernet0.addressType", "static");
        vmx.set("ethernet0.address", qstr(*specs.hardware_address));
        vmx.remove("ethernet0.generatedAddress");
        vmx.remove("ethernet0.generatedAddressOffset");
    }

    vmx.save();
}

void vl::VmrunVMController::set_remote_display(const std::string& vm, int port,
                                               const std::optional<std::string>& password)
{
    auto vmx = VmxFile::load(qstr(vm));
    vmx.set("RemoteDisplay.vnc.enabled", "TRUE");
    vmx.set("RemoteDisplay.vnc.port", QString::number(port));

    if (password && !password->empty())
    {
        if (password->size() > static_cast<std::size_t>(max_vnc_password_length))
            vll::warn(category, "VNC password of {} is longer than {} characters and will be truncated", vm,
                      max_vnc_password_length);
        vmx.set("RemoteDisplay.vnc.password", qstr(password->substr(0, max_vnc_password_length)));
    }
    else
    {
        vmx.remove("RemoteDisplay.vnc.password");
    }

    vmx.save();
}

std::string vl::VmrunVMController::guest_ip(const std::string& vm, const std::optional<GuestCredentials>& credentials)
{
    const auto output = QString::fromUtf8(run("getGuestIPAddress", {qstr(vm)}, credentials)).toStdString();
    if (!VL_UTILS.is_ipv4_valid(output))
        throw VMOperationException{ErrorKind::not_ready, "Guest of {} reported no usable address: {}", vm, output};

    return output;
}

void vl::VmrunVMController::copy_to_guest(const std::string& vm, const std::string& host_path,
                                          const std::string& guest_path, const GuestCredentials& credentials)
{
    run("copyFileFromHostToGuest", {qstr(vm), qstr(host_path), qstr(guest_path)}, credentials);
}

void vl::VmrunVMController::exec_in_guest(const std::string& vm, const std::string& program,
                                          const std::vector<std::string>& arguments,
                                          const GuestCredentials& credentials, bool interactive)
{
    QStringList parameters{qstr(vm)};
    if (interactive)
        parameters << "-interactive";
    parameters << qstr(program);
    for (const auto& argument : arguments)
        parameters << qstr(argument);

    run("runProgramInGuest", parameters, credentials);
}
