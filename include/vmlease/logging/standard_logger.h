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

#ifndef VMLEASE_STANDARD_LOGGER_H
#define VMLEASE_STANDARD_LOGGER_H

#include <vmlease/logging/logger.h>

#include <iosfwd>
#include <mutex>

namespace vmlease
{
namespace logging
{
class StandardLogger : public Logger
{
public:
    /**
     * Construct a StandardLogger that writes to std::cerr.
     *
     * @param [in] level Log calls with a level below this are filtered out.
     */
    StandardLogger(Level level);

    /**
     * Construct a StandardLogger that writes to @p target.
     *
     * @param [in] level Log calls with a level below this are filtered out.
     * @param [in] target ostream to write the output to
     */
    StandardLogger(Level level, std::ostream& target);

    /**
     * Write a line of the form `[timestamp] [level] [category] message` to the target.
     */
    void log(Level level, CString category, CString message) const override;

private:
    std::ostream& target;
    mutable std::mutex target_mutex; // workflows log from pool threads
};
} // namespace logging
} // namespace vmlease
#endif // VMLEASE_STANDARD_LOGGER_H
