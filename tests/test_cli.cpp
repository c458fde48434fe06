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

#include "common.h"
#include "file_operations.h"
#include "temp_dir.h"

#include <src/daemon/cli.h>

namespace vl = vmlease;
namespace vll = vmlease::logging;
namespace vlt = vmlease::test;
using namespace testing;

namespace
{
vl::cli::ParsedCommandLine parse(QStringList arguments)
{
    arguments.prepend("vmleased");
    return vl::cli::parse(arguments);
}

TEST(Cli, parses_reinstall_with_vm_id)
{
    const auto parsed = parse({"reinstall", "vm-1"});

    EXPECT_EQ(parsed.command, vl::DaemonCommand::reinstall);
    EXPECT_EQ(parsed.vm_id, "vm-1");
    EXPECT_EQ(parsed.builder.verbosity_level, vll::Level::info);
}

TEST(Cli, parses_commands_without_vm_id)
{
    EXPECT_EQ(parse({"recover"}).command, vl::DaemonCommand::recover);
    EXPECT_EQ(parse({"watch-expiry"}).command, vl::DaemonCommand::watch_expiry);
    EXPECT_EQ(parse({"status", "vm-2"}).command, vl::DaemonCommand::status);
}

TEST(Cli, rejects_unknown_commands)
{
    VL_EXPECT_THROW_THAT(parse({"rebuild", "vm-1"}), std::runtime_error,
                         vlt::match_what(HasSubstr("unknown command 'rebuild'")));
}

TEST(Cli, requires_a_command)
{
    VL_EXPECT_THROW_THAT(parse({}), std::runtime_error, vlt::match_what(HasSubstr("missing command")));
}

TEST(Cli, checks_vm_id_count)
{
    VL_EXPECT_THROW_THAT(parse({"reinstall"}), std::runtime_error, vlt::match_what(HasSubstr("one VM id")));
    VL_EXPECT_THROW_THAT(parse({"status", "vm-1", "vm-2"}), std::runtime_error,
                         vlt::match_what(HasSubstr("one VM id")));
    VL_EXPECT_THROW_THAT(parse({"recover", "vm-1"}), std::runtime_error, vlt::match_what(HasSubstr("no arguments")));
}

TEST(Cli, sets_verbosity)
{
    EXPECT_EQ(parse({"-V", "debug", "recover"}).builder.verbosity_level, vll::Level::debug);
    EXPECT_EQ(parse({"--verbosity", "TRACE", "recover"}).builder.verbosity_level, vll::Level::trace);

    VL_EXPECT_THROW_THAT(parse({"--verbosity", "chatty", "recover"}), std::runtime_error,
                         vlt::match_what(HasSubstr("invalid logging verbosity: chatty")));
}

TEST(Cli, overrides_records_path)
{
    EXPECT_EQ(parse({"--records", "/var/lib/vmlease/records.json", "recover"}).builder.records_path,
              "/var/lib/vmlease/records.json");
}

TEST(Cli, rejects_unknown_options)
{
    EXPECT_THROW(parse({"--frobnicate", "recover"}), std::runtime_error);
}

TEST(Cli, loads_settings_before_records_override)
{
    vlt::TempDir temp_dir;
    const auto ini_path = temp_dir.filePath("vmlease.ini");
    vlt::make_file_with_content(ini_path, "[records]\npath=/srv/records.json\n[reinstall]\nguest_ip_attempts=12\n");

    const auto from_file = parse({"--config", ini_path, "recover"});
    EXPECT_EQ(from_file.builder.records_path, "/srv/records.json");
    EXPECT_EQ(from_file.builder.reinstall_settings.guest_ip_attempts, 12);

    const auto overridden = parse({"--config", ini_path, "--records", "/tmp/records.json", "recover"});
    EXPECT_EQ(overridden.builder.records_path, "/tmp/records.json");
}

TEST(Cli, reports_missing_config_file)
{
    VL_EXPECT_THROW_THAT(parse({"--config", "/nonexistent/vmlease.ini", "recover"}), std::runtime_error,
                         vlt::match_what(HasSubstr("Configuration file not found")));
}
} // namespace
