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

#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace vmlease
{

/**
 * Exception base that formats its message with fmt.
 *
 * Derived exception types either inherit these constructors or call them explicitly.
 *
 * @tparam BaseExceptionType The exception type to derive from. Defaults to `std::runtime_error`.
 * It must be constructible from a std::string and derive from std::exception.
 */
template <typename BaseExceptionType = std::runtime_error>
struct FormattedExceptionBase : public BaseExceptionType
{
    static_assert(std::is_constructible<BaseExceptionType, std::string>::value ||
                      std::is_constructible<BaseExceptionType, std::error_code, std::string>::value,
                  "BaseExceptionType must either be constructible with (std::string) or "
                  "(std::error_code, std::string).");
    static_assert(std::is_base_of<std::exception, BaseExceptionType>::value,
                  "BaseExceptionType must derive from std::exception");

    template <typename... Args>
    FormattedExceptionBase(fmt::format_string<Args...> fmt, Args&&... args)
        : BaseExceptionType(failsafe_format(fmt, std::forward<Args>(args)...))
    {
    }

    template <typename... Args>
    FormattedExceptionBase(std::error_code ec, fmt::format_string<Args...> fmt, Args&&... args)
        : BaseExceptionType(ec, failsafe_format(fmt, std::forward<Args>(args)...))
    {
    }

private:
    /**
     * Format without throwing.
     *
     * An exception thrown while constructing another exception ends in std::terminate, so a
     * formatting error is turned into a message naming the offending format string instead.
     */
    template <typename... Args>
    static std::string failsafe_format(fmt::format_string<Args...> fmt, Args&&... args)
    try
    {
        return fmt::format(fmt, std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        std::string msg{"[Error while formatting the exception string]"};
        msg += "\nFormat string: `";
        const fmt::string_view fmt_str = fmt;
        msg += std::string{fmt_str.data(), fmt_str.size()};
        msg += "`\nFormat error: `";
        msg += e.what();
        msg += '`';
        return msg;
    }
};

} // namespace vmlease
