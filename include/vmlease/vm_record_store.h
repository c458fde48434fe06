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

#ifndef VMLEASE_VM_RECORD_STORE_H
#define VMLEASE_VM_RECORD_STORE_H

#include <vmlease/disabled_copy_move.h>
#include <vmlease/vm_record.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vmlease
{
/**
 * Durable VM records.
 *
 * Updates touch one group of fields at a time so that concurrent writers of unrelated fields do
 * not overwrite each other. Methods taking an id throw NoSuchVMException for unknown ids.
 */
class VMRecordStore : private DisabledCopyMove
{
public:
    using UPtr = std::unique_ptr<VMRecordStore>;

    virtual ~VMRecordStore() = default;

    virtual std::optional<VMRecord> find(const std::string& id) const = 0;
    virtual VMRecord get(const std::string& id) const = 0;
    virtual std::vector<VMRecord> all() const = 0;

    virtual void add(const VMRecord& record) = 0;
    // Throws RecordStoreException while a task is running on the record
    virtual void remove(const std::string& id) = 0;

    /**
     * Move the task from idle to running in a single step.
     *
     * @return false, with no change made, when the task is not idle
     */
    virtual bool try_begin_task(const std::string& id, int progress, const std::string& message) = 0;
    virtual void update_task(const std::string& id, const TaskState& task) = 0;

    virtual void set_network_identity(const std::string& id, const NetworkIdentity& identity) = 0;
    virtual void set_guest_credentials(const std::string& id, const GuestCredentials& credentials) = 0;
    virtual void set_expiry_notified(const std::string& id, bool notified) = 0;

    // Return abandoned tasks to idle: failed ones, and running ones whose holder process is gone.
    // Returns the ids that were reset.
    virtual std::vector<std::string> reset_abandoned_tasks() = 0;

protected:
    VMRecordStore() = default;
};
} // namespace vmlease

#endif // VMLEASE_VM_RECORD_STORE_H
