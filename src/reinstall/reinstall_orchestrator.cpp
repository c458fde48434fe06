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

#include "reinstall_orchestrator.h"
#include "guest_bootstrap_script.h"

#include <vmlease/best_effort.h>
#include <vmlease/exceptions/vm_operation_exception.h>
#include <vmlease/file_ops.h>
#include <vmlease/format.h>
#include <vmlease/logging/log.h>
#include <vmlease/top_catch_all.h>
#include <vmlease/utils.h>

#include <scope_guard.hpp>

#include <QDir>
#include <QFileInfo>
#include <QTemporaryFile>

#include <algorithm>
#include <stdexcept>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
constexpr auto category = "reinstall";
constexpr auto netsh = "C:\\Windows\\System32\\netsh.exe";
constexpr auto powershell = "C:\\Windows\\System32\\WindowsPowerShell\\v1.0\\powershell.exe";

std::string describe_guest_failure(const vl::VMOperationException& e)
{
    switch (e.kind())
    {
    case vl::ErrorKind::auth_rejected:
        return fmt::format("the guest rejected the baseline credentials ({})", e.what());
    case vl::ErrorKind::not_ready:
        return fmt::format("the guest tools were not ready ({})", e.what());
    case vl::ErrorKind::unavailable:
        return fmt::format("the hypervisor tooling was unavailable ({})", e.what());
    case vl::ErrorKind::unknown:
        break;
    }

    return e.what();
}

std::optional<vl::GuestCredentials> credentials_of(const vl::VMRecord& record)
{
    if (record.guest_credentials.username.empty())
        return std::nullopt;

    return record.guest_credentials;
}

// One pass of the workflow over one VM. Holds the stage and the progress persisted so far.
class ReinstallRun
{
public:
    ReinstallRun(const std::string& vm_id,
                 vl::VMRecordStore& store,
                 vl::VMController& controller,
                 vl::NetworkIdentityService& network,
                 vl::NotificationSink& sink,
                 const vl::ReinstallSettings& settings)
        : vm_id{vm_id}, store{store}, controller{controller}, network{network}, sink{sink}, settings{settings}
    {
    }

    vl::ReinstallResult execute();

private:
    void enter(vl::ReinstallStage next, int stage_progress, const std::string& message);
    void release(const vl::TaskState& task);
    void notify(vl::Outcome outcome,
                const std::string& summary,
                vl::Audience audience,
                std::vector<vl::NotificationField> fields = {});
    std::string name() const;

    void learn_identity(const std::string& address);
    void learn_current_address();
    void stop();
    void restore();
    void reprovision();
    void reserve_network();
    void boot();
    std::optional<std::string> wait_for_guest();
    void apply_static_addressing(const std::string& address);
    vl::BestEffort bootstrap();
    void push_and_run_bootstrap_script();

    vl::ReinstallResult finish(vl::Outcome outcome,
                               const std::string& summary,
                               const std::optional<std::string>& message,
                               std::vector<vl::NotificationField> fields);
    vl::ReinstallResult fail(const std::string& error);

    const std::string vm_id;
    vl::VMRecordStore& store;
    vl::VMController& controller;
    vl::NetworkIdentityService& network;
    vl::NotificationSink& sink;
    const vl::ReinstallSettings& settings;

    vl::VMRecord record;
    vl::ReinstallStage stage{vl::ReinstallStage::init};
    int progress{0};
    bool released{false};
    std::string last_guest_error{"no attempt was made"};
};

vl::ReinstallResult ReinstallRun::execute()
{
    auto release_guard = sg::make_scope_guard([this]() noexcept {
        if (!released)
            vl::top_catch_all(category, [this] {
                store.update_task(vm_id, {vl::TaskPhase::idle, 0, "Reinstall was interrupted"});
            });
    });

    try
    {
        record = store.get(vm_id);

        enter(vl::ReinstallStage::init, 5, "Preparing reinstall");
        notify(vl::Outcome::started, fmt::format("Reinstalling {}", name()), vl::Audience::public_audience);
        learn_current_address();

        stop();
        restore();
        reserve_network();
        boot();

        const auto address = wait_for_guest();
        if (!address)
        {
            const auto message = fmt::format("{} was reinstalled but its guest did not report an address after {} "
                                             "attempts ({}); remote access was not reconfigured",
                                             name(),
                                             settings.guest_ip_attempts,
                                             last_guest_error);
            return finish(vl::Outcome::warning, message, message, {});
        }

        const auto bootstrapped = bootstrap();

        std::vector<vl::NotificationField> fields{
            {"Remote access", fmt::format("{}:{}", record.remote_access.address, record.remote_access.port)},
            {"Username", settings.baseline_credentials.username},
            {"Password", settings.baseline_credentials.password}};

        if (bootstrapped.succeeded())
            return finish(vl::Outcome::success,
                          fmt::format("{} was reinstalled and is ready", name()),
                          std::nullopt,
                          std::move(fields));

        const auto message = fmt::format("{} was reinstalled but remote access could not be configured: {}",
                                         name(),
                                         *bootstrapped.diagnostic());
        return finish(vl::Outcome::warning, message, message, std::move(fields));
    }
    catch (const std::exception& e)
    {
        return fail(e.what());
    }
}

void ReinstallRun::enter(vl::ReinstallStage next, int stage_progress, const std::string& message)
{
    stage = next;
    progress = std::max(progress, stage_progress);
    store.update_task(vm_id, {vl::TaskPhase::running, progress, message});

    vll::info(category, "[{}] {} ({}%): {}", vm_id, vl::as_string(stage), progress, message);
}

void ReinstallRun::release(const vl::TaskState& task)
{
    store.update_task(vm_id, task);
    released = true;
}

void ReinstallRun::notify(vl::Outcome outcome,
                          const std::string& summary,
                          vl::Audience audience,
                          std::vector<vl::NotificationField> fields)
{
    const vl::NotificationEvent event{fmt::format("VM {}", name()),
                                      outcome,
                                      summary,
                                      std::move(fields),
                                      {audience, record.owner_id}};

    vl::best_effort(category, "notification", [this, &event] { sink.notify(event); });
}

std::string ReinstallRun::name() const
{
    return record.name.empty() ? vm_id : record.name;
}

void ReinstallRun::learn_identity(const std::string& address)
{
    vl::NetworkIdentity identity{address, ""};
    vl::best_effort(category, "reading the hardware address", [this, &identity] {
        identity.hardware_id = controller.read_specs(record.vmx_path).hardware_address.value_or("");
    });

    store.set_network_identity(vm_id, identity);
    record.network_identity = identity;

    vll::info(category,
              "[{}] Learned network identity {} ({})",
              vm_id,
              identity.address,
              identity.hardware_id.empty() ? "hardware address unknown" : identity.hardware_id);
}

void ReinstallRun::learn_current_address()
{
    if (record.network_identity)
        return;

    vl::best_effort(category, "learning the current address", [this] {
        if (controller.is_running(record.vmx_path))
            learn_identity(controller.guest_ip(record.vmx_path, credentials_of(record)));
    });
}

void ReinstallRun::stop()
{
    enter(vl::ReinstallStage::stopping, 10, "Stopping VM");

    if (controller.is_running(record.vmx_path))
    {
        controller.stop(record.vmx_path, /* forced = */ true);
        VL_UTILS.sleep_for(settings.stop_settle_delay);
    }
}

void ReinstallRun::restore()
{
    enter(vl::ReinstallStage::restoring, 20, "Looking for the baseline snapshot");

    const auto snapshots = controller.list_snapshots(record.vmx_path);
    if (std::find(snapshots.cbegin(), snapshots.cend(), settings.baseline_snapshot) != snapshots.cend())
    {
        enter(vl::ReinstallStage::restoring, 30, fmt::format("Reverting to snapshot {}", settings.baseline_snapshot));
        controller.revert_snapshot(record.vmx_path, settings.baseline_snapshot);
    }
    else
    {
        vll::warn(category,
                  "[{}] Snapshot {} not found, re-provisioning from the template",
                  vm_id,
                  settings.baseline_snapshot);
        reprovision();
    }

    enter(vl::ReinstallStage::restoring, 40, "Baseline restored");
}

void ReinstallRun::reprovision()
{
    const auto& source = record.template_origin.empty() ? settings.template_path : record.template_origin;
    if (source.empty())
        throw std::runtime_error{fmt::format("Snapshot {} is missing and no template is configured to re-provision from",
                                             settings.baseline_snapshot)};

    enter(vl::ReinstallStage::restoring, 22, "Reading VM specs");
    auto specs = controller.read_specs(record.vmx_path);
    if (record.network_identity && !record.network_identity->hardware_id.empty())
        specs.hardware_address = record.network_identity->hardware_id;

    enter(vl::ReinstallStage::restoring, 25, "Deleting VM");
    controller.delete_vm(record.vmx_path);

    const QFileInfo vmx_info{QString::fromStdString(record.vmx_path)};
    vl::best_effort(category, "purging the VM directory", [&vmx_info] {
        QDir storage_dir{vmx_info.absolutePath()};
        if (!vmx_info.isAbsolute() || storage_dir.isRoot())
            throw std::runtime_error{fmt::format("refusing to remove {}", storage_dir.path())};

        if (VL_FILEOPS.exists(storage_dir) && !VL_FILEOPS.remove_recursively(storage_dir))
            throw std::runtime_error{fmt::format("could not remove {}", storage_dir.path())};
    });

    enter(vl::ReinstallStage::restoring, 28, fmt::format("Cloning from {}", source));
    controller.clone(source, record.vmx_path, record.name, settings.clone_mode, settings.template_snapshot);

    enter(vl::ReinstallStage::restoring, 34, "Applying VM specs");
    controller.apply_specs(record.vmx_path, specs);
    if (record.remote_display.enabled)
        controller.set_remote_display(record.vmx_path, record.remote_display.port, record.remote_display.password);

    enter(vl::ReinstallStage::restoring, 37, fmt::format("Creating snapshot {}", settings.baseline_snapshot));
    controller.create_snapshot(record.vmx_path, settings.baseline_snapshot);
}

void ReinstallRun::reserve_network()
{
    enter(vl::ReinstallStage::networking, 45, "Restoring network identity");

    if (!record.network_identity)
    {
        vll::debug(category, "[{}] No known network identity, skipping the reservation", vm_id);
        return;
    }

    const auto& identity = *record.network_identity;
    vl::best_effort(category, "network reservation", [this, &identity] {
        if (identity.hardware_id.empty())
            throw std::runtime_error{"the hardware address is unknown"};

        network.reserve(name(), identity.hardware_id, identity.address);
    });
}

void ReinstallRun::boot()
{
    enter(vl::ReinstallStage::booting, 50, "Starting VM");
    controller.start(record.vmx_path);
}

std::optional<std::string> ReinstallRun::wait_for_guest()
{
    enter(vl::ReinstallStage::waiting_for_guest, 60, "Waiting for the guest to report an address");

    const auto max_attempts = settings.guest_ip_attempts;
    std::optional<std::string> address;
    const auto polled = vl::utils::retry_for(max_attempts, settings.guest_ip_interval, [&](int attempt) {
        try
        {
            address = controller.guest_ip(record.vmx_path, settings.baseline_credentials);
            return vl::utils::TimeoutAction::done;
        }
        catch (const vl::VMOperationException& e)
        {
            last_guest_error = describe_guest_failure(e);
            vll::debug(category, "[{}] No guest address yet ({}/{}): {}", vm_id, attempt, max_attempts, e.what());
        }

        enter(vl::ReinstallStage::waiting_for_guest,
              60 + attempt * 20 / max_attempts,
              fmt::format("Waiting for the guest to report an address ({}/{})", attempt, max_attempts));
        return vl::utils::TimeoutAction::retry;
    });

    if (polled.exhausted)
        return std::nullopt;

    enter(vl::ReinstallStage::waiting_for_guest, 80, fmt::format("Guest reachable at {}", *address));

    if (!record.network_identity)
        learn_identity(*address);
    else if (record.network_identity->address != *address)
        apply_static_addressing(record.network_identity->address);

    return address;
}

void ReinstallRun::apply_static_addressing(const std::string& address)
{
    const auto& addressing = settings.static_addressing;
    const auto interface = fmt::format("name={}", addressing.interface_name);
    const auto& credentials = settings.baseline_credentials;

    vl::best_effort(category, "re-applying static addressing", [&] {
        controller.exec_in_guest(
            record.vmx_path,
            netsh,
            {"interface", "ipv4", "set", "address", interface, "static", address, addressing.subnet_mask,
             addressing.gateway},
            credentials,
            false);

        for (std::size_t i = 0; i < addressing.dns_servers.size(); ++i)
        {
            if (i == 0)
                controller.exec_in_guest(record.vmx_path,
                                         netsh,
                                         {"interface", "ipv4", "set", "dnsservers", interface, "static",
                                          addressing.dns_servers[i], "primary"},
                                         credentials,
                                         false);
            else
                controller.exec_in_guest(record.vmx_path,
                                         netsh,
                                         {"interface", "ipv4", "add", "dnsservers", interface,
                                          addressing.dns_servers[i], fmt::format("index={}", i + 1)},
                                         credentials,
                                         false);
        }

        vll::info(category, "[{}] Re-applied static address {}", vm_id, address);
    });
}

vl::BestEffort ReinstallRun::bootstrap()
{
    enter(vl::ReinstallStage::bootstrapping, 85, "Resetting guest credentials");
    store.set_guest_credentials(vm_id, settings.baseline_credentials);
    record.guest_credentials = settings.baseline_credentials;

    enter(vl::ReinstallStage::bootstrapping, 88, "Configuring remote access in the guest");
    auto result = vl::best_effort(category, "guest bootstrap", [this]() -> vl::BestEffort {
        try
        {
            push_and_run_bootstrap_script();
            return vl::BestEffort::ok();
        }
        catch (const vl::VMOperationException& e)
        {
            vll::warn(category, "[{}] Guest bootstrap failed ({}): {}", vm_id, vl::as_string(e.kind()), e.what());
            return vl::BestEffort::failed(describe_guest_failure(e));
        }
    });

    enter(vl::ReinstallStage::bootstrapping,
          90,
          result.succeeded() ? "Remote access configured" : "Remote access could not be configured");
    return result;
}

void ReinstallRun::push_and_run_bootstrap_script()
{
    const auto script = vl::generate_bootstrap_script(record.remote_access.port);

    QTemporaryFile script_file{QDir::temp().filePath("vmlease-bootstrap-XXXXXX.ps1")};
    if (!script_file.open())
        throw std::runtime_error{fmt::format("could not create a temporary file: {}", script_file.errorString())};

    const auto contents = QByteArray::fromStdString(script);
    if (VL_FILEOPS.write(script_file, contents) != contents.size())
        throw std::runtime_error{
            fmt::format("could not write {}: {}", script_file.fileName(), script_file.errorString())};
    script_file.close();

    const auto& credentials = settings.baseline_credentials;
    controller.copy_to_guest(record.vmx_path, script_file.fileName().toStdString(), settings.guest_script_path,
                             credentials);
    controller.exec_in_guest(record.vmx_path,
                             powershell,
                             {"-NoProfile", "-NonInteractive", "-ExecutionPolicy", "Bypass", "-File",
                              settings.guest_script_path},
                             credentials,
                             false);
}

vl::ReinstallResult ReinstallRun::finish(vl::Outcome outcome,
                                         const std::string& summary,
                                         const std::optional<std::string>& message,
                                         std::vector<vl::NotificationField> fields)
{
    enter(vl::ReinstallStage::finalizing, 100, "Finalizing");
    release({vl::TaskPhase::idle, 0, message});
    stage = vl::ReinstallStage::done;

    vll::info(category, "[{}] Reinstall finished ({})", vm_id, vl::as_string(outcome));
    notify(outcome, summary, vl::Audience::private_audience, std::move(fields));

    return {outcome, vl::ReinstallStage::done, message};
}

vl::ReinstallResult ReinstallRun::fail(const std::string& error)
{
    const auto failed_stage = stage;
    const auto message = fmt::format("Reinstall failed while {}: {}", vl::as_string(failed_stage), error);
    vll::error(category, "[{}] {}", vm_id, message);

    stage = vl::ReinstallStage::failed;
    vl::best_effort(category, "recording the failure", [this, &message] {
        store.update_task(vm_id, {vl::TaskPhase::failed, progress, message});
    });

    notify(vl::Outcome::failure,
           message,
           vl::Audience::private_audience,
           {{"Stage", std::string{vl::as_string(failed_stage)}}, {"Error", error, false}});

    vl::best_effort(category, "releasing the task", [this, &message] {
        release({vl::TaskPhase::idle, 0, message});
    });

    return {vl::Outcome::failure, failed_stage, message};
}
} // namespace

vl::ReinstallOrchestrator::ReinstallOrchestrator(VMRecordStore& store,
                                                 VMController& controller,
                                                 NetworkIdentityService& network,
                                                 NotificationSink& sink,
                                                 ReinstallSettings settings)
    : store{store}, controller{controller}, network{network}, sink{sink}, reinstall_settings{std::move(settings)}
{
}

vl::ReinstallResult vl::ReinstallOrchestrator::run(const std::string& vm_id)
{
    vll::info(category, "[{}] Starting reinstall", vm_id);
    return ReinstallRun{vm_id, store, controller, network, sink, reinstall_settings}.execute();
}

const vl::ReinstallSettings& vl::ReinstallOrchestrator::settings() const noexcept
{
    return reinstall_settings;
}
