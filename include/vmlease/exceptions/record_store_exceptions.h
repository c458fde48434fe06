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

#include "formatted_exception_base.h"

#include <string>

namespace vmlease
{
class NoSuchVMException : public FormattedExceptionBase<std::out_of_range>
{
public:
    explicit NoSuchVMException(const std::string& vm_id)
        : FormattedExceptionBase<std::out_of_range>{"No VM record with id \"{}\"", vm_id}
    {
    }
};

class RecordStoreException : public FormattedExceptionBase<>
{
public:
    using FormattedExceptionBase<>::FormattedExceptionBase;
};
} // namespace vmlease
