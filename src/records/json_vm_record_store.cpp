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

#include "json_vm_record_store.h"

#include <vmlease/exceptions/record_store_exceptions.h>
#include <vmlease/file_ops.h>
#include <vmlease/format.h>
#include <vmlease/logging/log.h>

#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>

#include <chrono>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
constexpr auto category = "records";
constexpr auto document_stale_lock_time = std::chrono::seconds{10};
constexpr auto document_lock_timeout = std::chrono::seconds{10};

QString qstr(const std::string& s)
{
    return QString::fromStdString(s);
}

std::string str(const QJsonValue& value)
{
    return value.toString().toStdString();
}

std::optional<std::string> optional_str(const QJsonValue& value)
{
    if (!value.isString())
        return std::nullopt;

    return value.toString().toStdString();
}

QJsonValue optional_json(const std::optional<std::string>& value)
{
    return value ? QJsonValue{qstr(*value)} : QJsonValue{QJsonValue::Null};
}

QJsonObject task_to_json(const vl::TaskState& task)
{
    QJsonObject json;
    json.insert("phase", qstr(std::string{vl::as_string(task.phase)}));
    json.insert("progress", task.progress);
    json.insert("message", optional_json(task.message));
    return json;
}

vl::TaskState task_from_json(const QJsonObject& json)
{
    vl::TaskState task;
    if (json.contains("phase"))
        task.phase = vl::task_phase_from(str(json["phase"]));
    task.progress = json["progress"].toInt(0);
    task.message = optional_str(json["message"]);
    return task;
}
} // namespace

QJsonObject vl::record_to_json(const VMRecord& record)
{
    QJsonObject json;
    json.insert("name", qstr(record.name));
    json.insert("vmx_path", qstr(record.vmx_path));
    json.insert("template_origin", qstr(record.template_origin));
    json.insert("owner_id", optional_json(record.owner_id));

    if (record.network_identity)
    {
        QJsonObject identity;
        identity.insert("address", qstr(record.network_identity->address));
        identity.insert("hardware_id", qstr(record.network_identity->hardware_id));
        json.insert("network_identity", identity);
    }

    json.insert("guest_username", qstr(record.guest_credentials.username));
    json.insert("guest_password", qstr(record.guest_credentials.password));

    QJsonObject remote_access;
    remote_access.insert("address", qstr(record.remote_access.address));
    remote_access.insert("port", record.remote_access.port);
    remote_access.insert("username", qstr(record.remote_access.username));
    json.insert("remote_access", remote_access);

    QJsonObject remote_display;
    remote_display.insert("enabled", record.remote_display.enabled);
    remote_display.insert("port", record.remote_display.port);
    remote_display.insert("password", optional_json(record.remote_display.password));
    json.insert("remote_display", remote_display);

    if (record.expiration_date)
        json.insert("expiration_date", record.expiration_date->toString(Qt::ISODate));
    json.insert("expiry_notified", record.expiry_notified);

    json.insert("task", task_to_json(record.task));
    return json;
}

vl::VMRecord vl::record_from_json(const std::string& id, const QJsonObject& json)
{
    VMRecord record;
    record.id = id;
    record.name = json.contains("name") ? str(json["name"]) : id;
    record.vmx_path = str(json["vmx_path"]);
    record.template_origin = str(json["template_origin"]);
    record.owner_id = optional_str(json["owner_id"]);

    const auto identity = json["network_identity"].toObject();
    if (!identity["address"].toString().isEmpty())
        record.network_identity = NetworkIdentity{str(identity["address"]), str(identity["hardware_id"])};

    record.guest_credentials = GuestCredentials{str(json["guest_username"]), str(json["guest_password"])};

    const auto remote_access = json["remote_access"].toObject();
    if (remote_access.contains("address"))
        record.remote_access.address = str(remote_access["address"]);
    record.remote_access.port = remote_access["port"].toInt(record.remote_access.port);
    if (remote_access.contains("username"))
        record.remote_access.username = str(remote_access["username"]);

    const auto remote_display = json["remote_display"].toObject();
    record.remote_display.enabled = remote_display["enabled"].toBool(false);
    record.remote_display.port = remote_display["port"].toInt(record.remote_display.port);
    record.remote_display.password = optional_str(remote_display["password"]);

    if (json["expiration_date"].isString())
    {
        auto expiration = QDateTime::fromString(json["expiration_date"].toString(), Qt::ISODate);
        if (!expiration.isValid())
            throw RecordStoreException{"Invalid expiration date for VM \"{}\": {}", id,
                                       json["expiration_date"].toString()};
        record.expiration_date = expiration;
    }
    record.expiry_notified = json["expiry_notified"].toBool(false);

    record.task = task_from_json(json["task"].toObject());
    return record;
}

template <typename Action>
auto vl::JsonVMRecordStore::locked(Action&& action) const
{
    std::lock_guard<std::mutex> lock{mutex};

    if (!VL_FILEOPS.mkpath(QFileInfo{file_path}.absoluteDir(), "."))
        throw RecordStoreException{"Could not create directory for VM records {}", file_path};

    QLockFile document_lock{file_path + ".lock"};
    VL_FILEOPS.setStaleLockTime(document_lock, document_stale_lock_time);
    if (!VL_FILEOPS.tryLock(document_lock, document_lock_timeout))
        throw RecordStoreException{"Could not acquire lock on VM records {}", file_path};

    load();
    return action();
}

template <typename Modifier>
auto vl::JsonVMRecordStore::modify(const std::string& id, Modifier&& modifier)
{
    return locked([this, &id, &modifier] {
        auto it = records.find(id);
        if (it == records.end())
            throw NoSuchVMException{id};

        const auto previous = it->second;
        auto result = modifier(it->second);

        try
        {
            persist();
        }
        catch (const std::runtime_error&)
        {
            it->second = previous;
            throw;
        }

        if (it->second.task.phase != TaskPhase::running)
            release_task_lock(id);

        return result;
    });
}

vl::JsonVMRecordStore::JsonVMRecordStore(const QString& file_path) : file_path{file_path}
{
    locked([this] { vll::debug(category, "Loaded {} VM records from {}", records.size(), this->file_path); });
}

void vl::JsonVMRecordStore::load() const
{
    records.clear();

    QFile db_file{file_path};
    if (!VL_FILEOPS.exists(db_file))
        return;

    if (!VL_FILEOPS.open(db_file, QIODevice::ReadOnly))
        throw RecordStoreException{"Could not open VM records {}: {}", file_path, db_file.errorString()};

    QJsonParseError parse_error;
    const auto doc = QJsonDocument::fromJson(VL_FILEOPS.read_all(db_file), &parse_error);
    if (doc.isNull() || !doc.isObject())
        throw RecordStoreException{"Could not parse VM records {}: {}", file_path, parse_error.errorString()};

    const auto root = doc.object();
    for (auto it = root.constBegin(); it != root.constEnd(); ++it)
    {
        const auto id = it.key().toStdString();
        try
        {
            records.emplace(id, record_from_json(id, it.value().toObject()));
        }
        catch (const std::invalid_argument& e)
        {
            throw RecordStoreException{"Invalid record for VM \"{}\": {}", id, e.what()};
        }
    }
}

void vl::JsonVMRecordStore::persist() const
{
    QJsonObject root;
    for (const auto& [id, record] : records)
        root.insert(qstr(id), record_to_json(record));

    try
    {
        VL_FILEOPS.write_transactionally(file_path, QJsonDocument{root}.toJson());
    }
    catch (const std::runtime_error& e)
    {
        throw RecordStoreException{"Could not save VM records: {}", e.what()};
    }
}

QString vl::JsonVMRecordStore::task_lock_path(const std::string& id) const
{
    return QString{"%1.%2.task.lock"}.arg(file_path, qstr(id));
}

bool vl::JsonVMRecordStore::acquire_task_lock(const std::string& id)
{
    if (task_locks.count(id))
        return true;

    auto task_lock = std::make_unique<QLockFile>(task_lock_path(id));
    VL_FILEOPS.setStaleLockTime(*task_lock, std::chrono::milliseconds::zero()); // stale only once the holder dies
    if (!VL_FILEOPS.tryLock(*task_lock, std::chrono::milliseconds::zero()))
        return false;

    task_locks.emplace(id, std::move(task_lock));
    return true;
}

void vl::JsonVMRecordStore::release_task_lock(const std::string& id)
{
    task_locks.erase(id);
}

std::optional<vl::VMRecord> vl::JsonVMRecordStore::find(const std::string& id) const
{
    return locked([this, &id]() -> std::optional<VMRecord> {
        auto it = records.find(id);
        if (it == records.end())
            return std::nullopt;

        return it->second;
    });
}

vl::VMRecord vl::JsonVMRecordStore::get(const std::string& id) const
{
    if (auto record = find(id))
        return *record;

    throw NoSuchVMException{id};
}

std::vector<vl::VMRecord> vl::JsonVMRecordStore::all() const
{
    return locked([this] {
        std::vector<VMRecord> result;
        for (const auto& [id, record] : records)
            result.push_back(record);

        return result;
    });
}

void vl::JsonVMRecordStore::add(const VMRecord& record)
{
    if (record.id.empty())
        throw RecordStoreException{"Cannot add a VM record without an id"};

    locked([this, &record] {
        if (!records.emplace(record.id, record).second)
            throw RecordStoreException{"A VM record with id \"{}\" already exists", record.id};

        try
        {
            persist();
        }
        catch (const std::runtime_error&)
        {
            records.erase(record.id);
            throw;
        }
    });
}

void vl::JsonVMRecordStore::remove(const std::string& id)
{
    locked([this, &id] {
        auto it = records.find(id);
        if (it == records.end())
            throw NoSuchVMException{id};

        if (it->second.task.phase != TaskPhase::idle)
            throw RecordStoreException{"Cannot remove VM \"{}\" while a task is {}", id,
                                       as_string(it->second.task.phase)};

        const auto previous = it->second;
        records.erase(it);

        try
        {
            persist();
        }
        catch (const std::runtime_error&)
        {
            records.emplace(id, previous);
            throw;
        }
    });
}

bool vl::JsonVMRecordStore::try_begin_task(const std::string& id, int progress, const std::string& message)
{
    const auto began = locked([this, &id, progress, &message] {
        auto it = records.find(id);
        if (it == records.end())
            throw NoSuchVMException{id};

        if (it->second.task.phase != TaskPhase::idle || !acquire_task_lock(id))
            return false;

        it->second.task = TaskState{TaskPhase::running, progress, message};

        try
        {
            persist();
        }
        catch (const std::runtime_error&)
        {
            it->second.task = TaskState{};
            release_task_lock(id);
            throw;
        }

        return true;
    });

    vll::trace(category, "Lease on {}: {}", id, began ? "acquired" : "busy");
    return began;
}

void vl::JsonVMRecordStore::update_task(const std::string& id, const TaskState& task)
{
    modify(id, [&task](VMRecord& record) {
        record.task = task;
        return true;
    });
}

void vl::JsonVMRecordStore::set_network_identity(const std::string& id, const NetworkIdentity& identity)
{
    modify(id, [&identity](VMRecord& record) {
        record.network_identity = identity;
        return true;
    });
}

void vl::JsonVMRecordStore::set_guest_credentials(const std::string& id, const GuestCredentials& credentials)
{
    modify(id, [&credentials](VMRecord& record) {
        record.guest_credentials = credentials;
        return true;
    });
}

void vl::JsonVMRecordStore::set_expiry_notified(const std::string& id, bool notified)
{
    modify(id, [notified](VMRecord& record) {
        record.expiry_notified = notified;
        return true;
    });
}

std::vector<std::string> vl::JsonVMRecordStore::reset_abandoned_tasks()
{
    return locked([this] {
        const auto previous = records;
        std::vector<std::unique_ptr<QLockFile>> taken_over; // released once the reset is saved
        std::vector<std::string> reset;

        for (auto& [id, record] : records)
        {
            if (record.task.phase == TaskPhase::idle)
                continue;

            if (record.task.phase == TaskPhase::running)
            {
                if (task_locks.count(id))
                    continue;

                auto holder = std::make_unique<QLockFile>(task_lock_path(id));
                VL_FILEOPS.setStaleLockTime(*holder, std::chrono::milliseconds::zero());
                if (!VL_FILEOPS.tryLock(*holder, std::chrono::milliseconds::zero()))
                {
                    vll::debug(category, "Task on VM \"{}\" is held by a live process, leaving it", id);
                    continue;
                }
                taken_over.push_back(std::move(holder));
            }

            vll::warn(category, "Resetting task on VM \"{}\" abandoned at {}%", id, record.task.progress);
            record.task = TaskState{TaskPhase::idle, 0, "Interrupted by a restart of the service"};
            reset.push_back(id);
        }

        if (!reset.empty())
        {
            try
            {
                persist();
            }
            catch (const std::runtime_error&)
            {
                records = previous;
                throw;
            }
        }

        return reset;
    });
}
