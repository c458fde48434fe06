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

#ifndef VMLEASE_PROCESS_H
#define VMLEASE_PROCESS_H

#include <QByteArray>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <string>

namespace vmlease
{

struct ProcessState
{
    bool completed_successfully() const
    {
        return !error && exit_code && exit_code.value() == 0;
    }

    std::string failure_message() const;

    std::optional<int> exit_code; // not set if the process failed to start

    struct Error
    {
        QProcess::ProcessError state; // FailedToStart, Crashed, Timedout, ReadError, WriteError, UnknownError
        QString message;
    };

    std::optional<Error> error;
};

// A blocking handle on an external program
class Process
{
public:
    using UPtr = std::unique_ptr<Process>;

    virtual ~Process() = default;

    virtual QString program() const = 0;
    virtual QStringList arguments() const = 0;

    // Start, wait for the process to end within timeout ms, and report how it went
    virtual ProcessState execute(const int timeout = 30000) = 0;

    virtual QByteArray read_all_standard_output() = 0;
    virtual QByteArray read_all_standard_error() = 0;
};
} // namespace vmlease

#endif // VMLEASE_PROCESS_H
