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

#ifndef VMLEASE_VM_SPECS_H
#define VMLEASE_VM_SPECS_H

#include <optional>
#include <string>

namespace vmlease
{
struct VMSpecs
{
    int cpu_count;
    int memory_mb;
    std::optional<std::string> hardware_address; // primary NIC; pinned on apply when set

    bool operator==(const VMSpecs&) const = default;
};
} // namespace vmlease

#endif // VMLEASE_VM_SPECS_H
