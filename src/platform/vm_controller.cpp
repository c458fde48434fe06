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

#include <vmlease/vm_controller.h>

#include <vmlease/format.h>

#include <stdexcept>

namespace vl = vmlease;

vl::CloneMode vl::clone_mode_from(const std::string& value)
{
    if (value == "linked")
        return CloneMode::linked;
    if (value == "full")
        return CloneMode::full;

    throw std::invalid_argument{fmt::format("invalid clone mode: {}. Valid modes are: full|linked.", value)};
}
