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

#include <vmlease/format.h>
#include <vmlease/logging/log.h>
#include <vmlease/process/basic_process.h>

namespace vl = vmlease;
namespace vll = vmlease::logging;

vl::BasicProcess::BasicProcess(std::shared_ptr<vl::ProcessSpec> spec) : process_spec{spec}
{
    process.setProgram(process_spec->program());
    process.setArguments(process_spec->arguments());
}

QString vl::BasicProcess::program() const
{
    return process.program();
}

QStringList vl::BasicProcess::arguments() const
{
    return process.arguments();
}

vl::ProcessState vl::BasicProcess::execute(const int timeout)
{
    const auto category = process_spec->program().toStdString();
    vll::debug(category, "started: {} {}", process_spec->program(), process_spec->loggable_arguments());

    vl::ProcessState exit_state;
    process.start();

    if (!process.waitForStarted(timeout) || !process.waitForFinished(timeout) ||
        process.exitStatus() != QProcess::NormalExit)
    {
        vll::log(vll::Level::error, category, process.errorString().toStdString());
        exit_state.error = current_error();

        if (process.state() == QProcess::Running)
        {
            process.kill();
            process.waitForFinished(timeout);
        }

        return exit_state;
    }

    exit_state.exit_code = process.exitCode();
    return exit_state;
}

QByteArray vl::BasicProcess::read_all_standard_output()
{
    return process.readAllStandardOutput();
}

QByteArray vl::BasicProcess::read_all_standard_error()
{
    return process.readAllStandardError();
}

vl::ProcessState::Error vl::BasicProcess::current_error() const
{
    return {process.error(), QString{"program: %1; error: %2"}.arg(process_spec->program(), process.errorString())};
}
