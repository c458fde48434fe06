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

#include <vmlease/vm_record.h>

#include <vmlease/format.h>

#include <stdexcept>

namespace vl = vmlease;

vl::TaskPhase vl::task_phase_from(std::string_view value)
{
    for (auto phase : {TaskPhase::idle, TaskPhase::running, TaskPhase::failed})
    {
        if (as_string(phase) == value)
            return phase;
    }

    throw std::invalid_argument{fmt::format("invalid task phase: {}", value)};
}
