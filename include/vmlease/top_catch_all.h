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

#ifndef VMLEASE_TOP_CATCH_ALL_H
#define VMLEASE_TOP_CATCH_ALL_H

#include <vmlease/format.h>
#include <vmlease/logging/log.h>

#include <functional>
#include <type_traits>

namespace vmlease
{
namespace detail
{
void error(const vmlease::logging::CString& log_category, const std::exception& e); // not noexcept, logging isn't
void error(const vmlease::logging::CString& log_category);                         // not noexcept, logging isn't
} // namespace detail

/**
 * Call a non-void function, logging and absorbing anything it throws.
 *
 * @param log_category The category to log exceptions under
 * @param fallback_return The value to return when an exception is caught
 * @param f The function to protect
 * @param args The arguments to pass to f
 * @return The result of f when it returns normally, fallback_return otherwise
 * @note Calls `terminate()` if logging itself throws.
 */
template <typename T, typename Fun, typename... Args>
auto top_catch_all(const logging::CString& log_category, T&& fallback_return, Fun&& f, Args&&... args) noexcept
    -> std::invoke_result_t<Fun, Args...>;

/**
 * Call a void function, logging and absorbing anything it throws.
 *
 * @note Calls `terminate()` if logging itself throws.
 */
template <typename Fun, typename... Args>
void top_catch_all(const logging::CString& log_category, Fun&& f, Args&&... args) noexcept;
} // namespace vmlease

inline void vmlease::detail::error(const vmlease::logging::CString& log_category, const std::exception& e)
{
    namespace vll = vmlease::logging;
    vll::log(vll::Level::error, log_category, fmt::format("Caught an unhandled exception: {}", e.what()));
}

inline void vmlease::detail::error(const vmlease::logging::CString& log_category)
{
    namespace vll = vmlease::logging;
    vll::log(vll::Level::error, log_category, "Caught an unknown exception");
}

template <typename T, typename Fun, typename... Args>
inline auto vmlease::top_catch_all(const logging::CString& log_category, T&& fallback_return, Fun&& f,
                                   Args&&... args) noexcept -> std::invoke_result_t<Fun, Args...>
{
    try
    {
        return std::invoke(std::forward<Fun>(f), std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        detail::error(log_category, e);
    }
    catch (...)
    {
        detail::error(log_category);
    }

    return std::forward<decltype(fallback_return)>(fallback_return);
}

template <typename Fun, typename... Args>
inline void vmlease::top_catch_all(const logging::CString& log_category, Fun&& f, Args&&... args) noexcept
{
    try
    {
        std::invoke(std::forward<Fun>(f), std::forward<Args>(args)...);
    }
    catch (const std::exception& e)
    {
        detail::error(log_category, e);
    }
    catch (...)
    {
        detail::error(log_category);
    }
}

#endif // VMLEASE_TOP_CATCH_ALL_H
