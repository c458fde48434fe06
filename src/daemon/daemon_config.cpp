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

#include "daemon_config.h"

#include <src/network/command_network_identity_service.h>
#include <src/notifications/logging_notification_sink.h>
#include <src/notifications/multiplexing_notification_sink.h>
#include <src/records/json_vm_record_store.h>

#include <vmlease/format.h>
#include <vmlease/logging/log.h>
#include <vmlease/logging/standard_logger.h>
#include <vmlease/utils.h>

#include <QFileInfo>
#include <QSettings>
#include <QStringList>

#include <stdexcept>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
QString string_value(const QSettings& settings, const QString& key, const QString& fallback)
{
    return settings.value(key, fallback).toString();
}

std::string std_string_value(const QSettings& settings, const QString& key, const std::string& fallback)
{
    return string_value(settings, key, QString::fromStdString(fallback)).toStdString();
}

int int_value(const QSettings& settings, const QString& key, int fallback, int min)
{
    if (!settings.contains(key))
        return fallback;

    const auto text = settings.value(key).toString();
    bool ok = false;
    const auto value = text.toInt(&ok);
    if (!ok || value < min)
        throw std::runtime_error{fmt::format("Invalid value for {}: '{}' (expected an integer of at least {})",
                                             key,
                                             text,
                                             min)};

    return value;
}

// QSettings hands comma separated INI values back as lists
std::vector<std::string> list_value(const QSettings& settings, const QString& key, const std::vector<std::string>& fallback)
{
    if (!settings.contains(key))
        return fallback;

    std::vector<std::string> ret;
    for (const auto& entry : settings.value(key).toStringList())
        for (const auto& item : entry.split(',', Qt::SkipEmptyParts))
        {
            const auto trimmed = item.trimmed();
            if (!trimmed.isEmpty())
                ret.push_back(trimmed.toStdString());
        }

    return ret;
}
} // namespace

vl::DaemonConfig::~DaemonConfig()
{
    vll::set_logger(nullptr);
}

void vl::DaemonConfigBuilder::load_settings(const QString& ini_path)
{
    if (!QFileInfo::exists(ini_path))
        throw std::runtime_error{fmt::format("Configuration file not found: {}", ini_path)};

    const QSettings settings{ini_path, QSettings::IniFormat};
    if (settings.status() != QSettings::NoError)
        throw std::runtime_error{fmt::format("Could not read the configuration file {}", ini_path)};

    vmrun_settings.vmrun_path = string_value(settings, "vmrun/path", vmrun_settings.vmrun_path);
    vmrun_settings.host_type = string_value(settings, "vmrun/host_type", vmrun_settings.host_type);
    vmrun_settings.start_mode = string_value(settings, "vmrun/start_mode", vmrun_settings.start_mode);
    vmrun_settings.timeout_ms = int_value(settings, "vmrun/timeout_ms", vmrun_settings.timeout_ms, 1);
    if (vmrun_settings.start_mode != "gui" && vmrun_settings.start_mode != "nogui")
        throw std::runtime_error{
            fmt::format("Invalid value for vmrun/start_mode: '{}' (expected gui or nogui)", vmrun_settings.start_mode)};

    auto& reinstall = reinstall_settings;
    reinstall.template_path = std_string_value(settings, "template/path", reinstall.template_path);
    reinstall.template_snapshot = std_string_value(settings, "template/snapshot", reinstall.template_snapshot);
    if (settings.contains("template/clone_mode"))
    {
        try
        {
            reinstall.clone_mode = clone_mode_from(settings.value("template/clone_mode").toString().toStdString());
        }
        catch (const std::invalid_argument& e)
        {
            throw std::runtime_error{fmt::format("Invalid value for template/clone_mode: {}", e.what())};
        }
    }

    reinstall.baseline_snapshot = std_string_value(settings, "reinstall/baseline_snapshot", reinstall.baseline_snapshot);
    reinstall.baseline_credentials.username =
        std_string_value(settings, "reinstall/baseline_username", reinstall.baseline_credentials.username);
    reinstall.baseline_credentials.password =
        std_string_value(settings, "reinstall/baseline_password", reinstall.baseline_credentials.password);
    reinstall.guest_ip_attempts =
        int_value(settings, "reinstall/guest_ip_attempts", reinstall.guest_ip_attempts, 1);
    reinstall.guest_ip_interval = std::chrono::milliseconds{
        int_value(settings,
                  "reinstall/guest_ip_interval_ms",
                  static_cast<int>(reinstall.guest_ip_interval.count()),
                  0)};
    reinstall.stop_settle_delay = std::chrono::milliseconds{
        int_value(settings,
                  "reinstall/stop_settle_ms",
                  static_cast<int>(reinstall.stop_settle_delay.count()),
                  0)};
    reinstall.guest_script_path = std_string_value(settings, "reinstall/guest_script_path", reinstall.guest_script_path);

    auto& addressing = reinstall.static_addressing;
    addressing.interface_name = std_string_value(settings, "network/interface", addressing.interface_name);
    addressing.gateway = std_string_value(settings, "network/gateway", addressing.gateway);
    addressing.subnet_mask = std_string_value(settings, "network/subnet_mask", addressing.subnet_mask);
    addressing.dns_servers = list_value(settings, "network/dns", addressing.dns_servers);
    for (const auto& address : {addressing.gateway, addressing.subnet_mask})
        if (!VL_UTILS.is_ipv4_valid(address))
            throw std::runtime_error{fmt::format("Invalid IPv4 address in the network settings: '{}'", address)};
    for (const auto& address : addressing.dns_servers)
        if (!VL_UTILS.is_ipv4_valid(address))
            throw std::runtime_error{fmt::format("Invalid DNS server address: '{}'", address)};

    reservation_command = string_value(settings, "network/reservation_command", reservation_command);
    records_path = string_value(settings, "records/path", records_path);
    expiry_check_interval = std::chrono::seconds{
        int_value(settings, "expiry/check_interval_s", static_cast<int>(expiry_check_interval.count()), 1)};
}

std::unique_ptr<const vl::DaemonConfig> vl::DaemonConfigBuilder::build()
{
    // Install logger as early as possible
    if (logger == nullptr)
        logger = std::make_unique<vll::StandardLogger>(verbosity_level);

    auto multiplexing_logger = std::make_shared<vll::MultiplexingLogger>(std::move(logger));
    vll::set_logger(multiplexing_logger);

    if (record_store == nullptr)
        record_store = std::make_unique<JsonVMRecordStore>(records_path);
    if (vm_controller == nullptr)
        vm_controller = std::make_unique<VmrunVMController>(vmrun_settings);
    if (network_identity_service == nullptr)
        network_identity_service = std::make_unique<CommandNetworkIdentityService>(reservation_command);
    if (notification_sink == nullptr)
    {
        auto sinks = std::make_unique<MultiplexingNotificationSink>();
        sinks->add_sink(std::make_unique<LoggingNotificationSink>());
        notification_sink = std::move(sinks);
    }

    if (reinstall_settings.template_path.empty())
        vll::warn("daemon", "No template configured; VMs without a baseline snapshot cannot be re-provisioned");

    return std::unique_ptr<const DaemonConfig>(new DaemonConfig{std::move(record_store),
                                                                std::move(vm_controller),
                                                                std::move(network_identity_service),
                                                                std::move(notification_sink),
                                                                std::move(multiplexing_logger),
                                                                reinstall_settings,
                                                                expiry_check_interval,
                                                                progress_poll_interval});
}
