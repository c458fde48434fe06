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

#include "cli.h"
#include "daemon.h"
#include "daemon_config.h"

#include <vmlease/constants.h>
#include <vmlease/format.h>
#include <vmlease/logging/log.h>
#include <vmlease/top_catch_all.h>

#include <QCoreApplication>
#include <QThreadPool>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
int main_impl(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(vl::daemon_name);
    QCoreApplication::setApplicationVersion(vl::version_string);

    auto command_line = vl::cli::parse(app.arguments());
    auto config = command_line.builder.build();

    vll::info("daemon", "Starting vmlease {}", vl::version_string);
    vll::debug("daemon", "Daemon arguments: {}", app.arguments().join(" "));

    auto exit_code = vl::ReturnCode::failed;
    {
        vl::Daemon daemon(std::move(config));
        exit_code = daemon.run(command_line.command, command_line.vm_id);
    }

    // QConcurrent::run() invocations are dispatched through thread pools. Wait until all threads in the
    // global one are properly cleaned up.
    QThreadPool::globalInstance()->waitForDone();
    vll::info("daemon", "Goodbye!");
    return exit_code;
}
} // namespace

int main(int argc, char* argv[])
{
    return vl::top_catch_all("daemon", EXIT_FAILURE, main_impl, argc, argv);
}
