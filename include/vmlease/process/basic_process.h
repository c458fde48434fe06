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

#ifndef VMLEASE_BASIC_PROCESS_H
#define VMLEASE_BASIC_PROCESS_H

#include <vmlease/process/process.h>
#include <vmlease/process/process_spec.h>

#include <memory>

namespace vmlease
{

// Process implemented directly on QProcess
class BasicProcess : public Process
{
public:
    explicit BasicProcess(std::shared_ptr<ProcessSpec> spec);

    QString program() const override;
    QStringList arguments() const override;

    ProcessState execute(const int timeout = 30000) override;

    QByteArray read_all_standard_output() override;
    QByteArray read_all_standard_error() override;

private:
    ProcessState::Error current_error() const;

    const std::shared_ptr<ProcessSpec> process_spec;
    QProcess process;
};

} // namespace vmlease

#endif // VMLEASE_BASIC_PROCESS_H
