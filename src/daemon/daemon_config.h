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

#ifndef VMLEASE_DAEMON_CONFIG_H
#define VMLEASE_DAEMON_CONFIG_H

#include <src/platform/backends/vmrun/vmrun_vm_controller.h>
#include <src/reinstall/reinstall_orchestrator.h>

#include <vmlease/constants.h>
#include <vmlease/logging/logger.h>
#include <vmlease/logging/multiplexing_logger.h>
#include <vmlease/network_identity_service.h>
#include <vmlease/notification_sink.h>
#include <vmlease/vm_controller.h>
#include <vmlease/vm_record_store.h>

#include <QString>

#include <chrono>
#include <memory>

namespace vmlease
{
struct DaemonConfig
{
    ~DaemonConfig();
    const std::unique_ptr<VMRecordStore> record_store;
    const std::unique_ptr<VMController> vm_controller;
    const std::unique_ptr<NetworkIdentityService> network_identity_service;
    const std::unique_ptr<NotificationSink> notification_sink;
    const std::shared_ptr<logging::MultiplexingLogger> logger;
    const ReinstallSettings reinstall_settings;
    const std::chrono::seconds expiry_check_interval;
    const std::chrono::milliseconds progress_poll_interval;
};

struct DaemonConfigBuilder
{
    std::unique_ptr<VMRecordStore> record_store;
    std::unique_ptr<VMController> vm_controller;
    std::unique_ptr<NetworkIdentityService> network_identity_service;
    std::unique_ptr<NotificationSink> notification_sink;
    std::unique_ptr<logging::Logger> logger;
    QString records_path{default_records_file};
    QString reservation_command;
    VmrunSettings vmrun_settings;
    ReinstallSettings reinstall_settings;
    std::chrono::seconds expiry_check_interval{default_expiry_check_interval};
    std::chrono::milliseconds progress_poll_interval{1s};
    logging::Level verbosity_level{logging::Level::info};

    // Overlay the values found in an INI file. Throws std::runtime_error on missing files or invalid values.
    void load_settings(const QString& ini_path);

    std::unique_ptr<const DaemonConfig> build();
};
} // namespace vmlease

#endif // VMLEASE_DAEMON_CONFIG_H
