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

#include <vmlease/constants.h>
#include <vmlease/format.h>

#include <QCommandLineOption>
#include <QCommandLineParser>

#include <stdexcept>

namespace vl = vmlease;
namespace vll = vmlease::logging;

namespace
{
vll::Level to_logging_level(const QString& value)
{
    auto value_lower = value.toLower();

    if (value_lower == "error")
        return vll::Level::error;
    if (value_lower == "warning")
        return vll::Level::warning;
    if (value_lower == "info")
        return vll::Level::info;
    if (value_lower == "debug")
        return vll::Level::debug;
    if (value_lower == "trace")
        return vll::Level::trace;

    throw std::runtime_error(fmt::format("invalid logging verbosity: {}. "
                                         "Valid levels are: error|warning|info|debug|trace.",
                                         value));
}

vl::DaemonCommand to_command(const QString& value)
{
    if (value == "reinstall")
        return vl::DaemonCommand::reinstall;
    if (value == "status")
        return vl::DaemonCommand::status;
    if (value == "recover")
        return vl::DaemonCommand::recover;
    if (value == "watch-expiry")
        return vl::DaemonCommand::watch_expiry;

    throw std::runtime_error(
        fmt::format("unknown command '{}'. Valid commands are: reinstall|status|recover|watch-expiry.", value));
}

bool takes_vm_id(vl::DaemonCommand command)
{
    return command == vl::DaemonCommand::reinstall || command == vl::DaemonCommand::status;
}
} // namespace

vl::cli::ParsedCommandLine vl::cli::parse(const QStringList& arguments)
{
    QCommandLineParser parser;
    parser.setApplicationDescription("vmlease reinstall service");
    auto help_option = parser.addHelpOption();
    auto version_option = parser.addVersionOption();

    QCommandLineOption verbosity_option{
        {"V", "verbosity"}, "specifies the logging verbosity level", "error|warning|info|debug|trace"};
    QCommandLineOption config_option{"config", "reads settings from the given INI file", "file"};
    QCommandLineOption records_option{"records", "specifies the VM records file", "file"};

    parser.addOption(verbosity_option);
    parser.addOption(config_option);
    parser.addOption(records_option);
    parser.addPositionalArgument("command", "reinstall|status|recover|watch-expiry");
    parser.addPositionalArgument("vm-id", "the VM to act on (reinstall and status)", "[vm-id]");

    if (!parser.parse(arguments))
        throw std::runtime_error(parser.errorText().toStdString());

    if (parser.isSet(help_option))
        parser.showHelp();
    if (parser.isSet(version_option))
        parser.showVersion();

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty())
        throw std::runtime_error("missing command. Valid commands are: reinstall|status|recover|watch-expiry.");

    ParsedCommandLine ret{{}, to_command(positional.first()), {}};
    const auto expected_count = takes_vm_id(ret.command) ? 2 : 1;
    if (positional.size() != expected_count)
        throw std::runtime_error(fmt::format("'{}' takes {}",
                                             positional.first(),
                                             takes_vm_id(ret.command) ? "one VM id" : "no arguments"));

    if (takes_vm_id(ret.command))
        ret.vm_id = positional.at(1).toStdString();

    if (parser.isSet(config_option))
        ret.builder.load_settings(parser.value(config_option));

    if (parser.isSet(verbosity_option))
        ret.builder.verbosity_level = to_logging_level(parser.value(verbosity_option));

    if (parser.isSet(records_option))
        ret.builder.records_path = parser.value(records_option);

    return ret;
}
