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

#ifndef VMLEASE_LEVEL_H
#define VMLEASE_LEVEL_H

#include <vmlease/logging/cstring.h>

#include <type_traits>

namespace vmlease
{
namespace logging
{

/**
 * The level of a log entry, in decreasing order of severity.
 */
enum class Level : int
{
    error = 0,   /**< An operation could not be carried out. A reinstall that logs at this level ends in failure. */
    warning = 1, /**< Something went wrong but the main goal was still reached, e.g. a best-effort step failed */
    info = 2,    /**< Lifecycle information an operator may want to follow */
    debug = 3,   /**< Information useful for troubleshooting, such as the external commands being run */
    trace = 4    /**< Fine-grained detail that would clutter the logs if enabled by default */
};

constexpr CString as_string(const Level& l) noexcept
{
    switch (l)
    {
    case Level::debug:
        return "debug";
    case Level::error:
        return "error";
    case Level::info:
        return "info";
    case Level::warning:
        return "warning";
    case Level::trace:
        return "trace";
    }
    return "unknown";
}

constexpr auto enum_type(Level e) noexcept
{
    return static_cast<std::underlying_type_t<Level>>(e);
}

constexpr Level level_from(std::underlying_type_t<Level> in)
{
    return static_cast<Level>(in);
}

constexpr bool operator<(Level a, Level b) noexcept
{
    return enum_type(a) < enum_type(b);
}

constexpr bool operator>(Level a, Level b) noexcept
{
    return enum_type(a) > enum_type(b);
}

constexpr bool operator<=(Level a, Level b) noexcept
{
    return enum_type(a) <= enum_type(b);
}

constexpr bool operator>=(Level a, Level b) noexcept
{
    return enum_type(a) >= enum_type(b);
}
} // namespace logging
} // namespace vmlease

#endif // VMLEASE_LEVEL_H
