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

#ifndef VMLEASE_VM_OPERATION_EXCEPTION_H
#define VMLEASE_VM_OPERATION_EXCEPTION_H

#include "formatted_exception_base.h"

#include <string_view>

namespace vmlease
{
// Why a hypervisor or guest operation failed, decided where the backend's output is interpreted
enum class ErrorKind
{
    auth_rejected, // guest credentials missing or refused
    not_ready,     // guest tools not running yet, or no address reported
    unavailable,   // hypervisor tooling missing or not responding
    unknown
};

constexpr std::string_view as_string(ErrorKind kind) noexcept
{
    switch (kind)
    {
    case ErrorKind::auth_rejected:
        return "auth rejected";
    case ErrorKind::not_ready:
        return "not ready";
    case ErrorKind::unavailable:
        return "unavailable";
    case ErrorKind::unknown:
        return "unknown";
    }
    return "unknown";
}

class VMOperationException : public FormattedExceptionBase<>
{
public:
    template <typename... Args>
    VMOperationException(ErrorKind kind, fmt::format_string<Args...> fmt, Args&&... args)
        : FormattedExceptionBase<>{fmt, std::forward<Args>(args)...}, error_kind{kind}
    {
    }

    ErrorKind kind() const noexcept
    {
        return error_kind;
    }

private:
    ErrorKind error_kind;
};
} // namespace vmlease

#endif // VMLEASE_VM_OPERATION_EXCEPTION_H
