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

#include <vmlease/process/basic_process.h>
#include <vmlease/process/process_factory.h>
#include <vmlease/process/simple_process_spec.h>

namespace vl = vmlease;

vl::ProcessFactory::ProcessFactory(const Singleton<ProcessFactory>::PrivatePass& pass)
    : Singleton<ProcessFactory>::Singleton{pass}
{
}

std::unique_ptr<vl::Process> vl::ProcessFactory::create_process(std::unique_ptr<vl::ProcessSpec>&& process_spec) const
{
    return std::make_unique<BasicProcess>(std::move(process_spec));
}

std::unique_ptr<vl::Process> vl::ProcessFactory::create_process(const QString& command, const QStringList& args) const
{
    return create_process(simple_process_spec(command, args));
}
