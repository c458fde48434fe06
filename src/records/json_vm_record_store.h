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

#ifndef VMLEASE_JSON_VM_RECORD_STORE_H
#define VMLEASE_JSON_VM_RECORD_STORE_H

#include <vmlease/vm_record_store.h>

#include <QJsonObject>
#include <QLockFile>
#include <QString>

#include <map>
#include <memory>
#include <mutex>

namespace vmlease
{
QJsonObject record_to_json(const VMRecord& record);
VMRecord record_from_json(const std::string& id, const QJsonObject& json);

// VM records kept in one JSON document shared by every process that opens it. Each operation takes the
// document lock, reloads the document and, when it changes something, rewrites it atomically. The holder of a
// running task keeps a per-VM lock file for as long as the task runs, so abandoned tasks can be told apart
// from tasks that another live process is still running.
class JsonVMRecordStore : public VMRecordStore
{
public:
    explicit JsonVMRecordStore(const QString& file_path);

    std::optional<VMRecord> find(const std::string& id) const override;
    VMRecord get(const std::string& id) const override;
    std::vector<VMRecord> all() const override;

    void add(const VMRecord& record) override;
    void remove(const std::string& id) override;

    bool try_begin_task(const std::string& id, int progress, const std::string& message) override;
    void update_task(const std::string& id, const TaskState& task) override;

    void set_network_identity(const std::string& id, const NetworkIdentity& identity) override;
    void set_guest_credentials(const std::string& id, const GuestCredentials& credentials) override;
    void set_expiry_notified(const std::string& id, bool notified) override;

    std::vector<std::string> reset_abandoned_tasks() override;

private:
    template <typename Action>
    auto locked(Action&& action) const;
    template <typename Modifier>
    auto modify(const std::string& id, Modifier&& modifier);
    void load() const;    // with the document locked
    void persist() const; // with the document locked

    QString task_lock_path(const std::string& id) const;
    bool acquire_task_lock(const std::string& id); // with the document locked
    void release_task_lock(const std::string& id); // with the document locked

    const QString file_path;
    mutable std::mutex mutex;
    mutable std::map<std::string, VMRecord> records;
    std::map<std::string, std::unique_ptr<QLockFile>> task_locks;
};
} // namespace vmlease

#endif // VMLEASE_JSON_VM_RECORD_STORE_H
