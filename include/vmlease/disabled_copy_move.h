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

#ifndef VMLEASE_DISABLED_COPY_MOVE_H
#define VMLEASE_DISABLED_COPY_MOVE_H

namespace vmlease
{

/**
 * Base class that disables copy and move construction and assignment.
 *
 * Inherit privately:
 * @code
 *  class RecordStore : private DisabledCopyMove {...};
 * @endcode
 */
class DisabledCopyMove
{
public:
    DisabledCopyMove(const DisabledCopyMove&) = delete;
    DisabledCopyMove& operator=(const DisabledCopyMove&) = delete;

protected:
    DisabledCopyMove() = default;
    ~DisabledCopyMove() = default; // non-virtual, but protected - see Core Guidelines C.35
};
} // namespace vmlease

#endif // VMLEASE_DISABLED_COPY_MOVE_H
