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

#ifndef VMLEASE_CLI_H
#define VMLEASE_CLI_H

#include "daemon.h"
#include "daemon_config.h"

#include <QStringList>

#include <string>

namespace vmlease
{
namespace cli
{
struct ParsedCommandLine
{
    DaemonConfigBuilder builder;
    DaemonCommand command;
    std::string vm_id;
};

// Throws std::runtime_error on invalid command lines. Exits after printing --help or --version.
ParsedCommandLine parse(const QStringList& arguments);
} // namespace cli
} // namespace vmlease

#endif // VMLEASE_CLI_H
