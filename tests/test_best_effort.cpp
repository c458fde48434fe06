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
#include "mock_logger.h"

#include <vmlease/best_effort.h>

namespace vl = vmlease;
namespace vll = vmlease::logging;
namespace vlt = vmlease::test;
using namespace testing;

namespace
{
struct BestEffort : public Test
{
    vlt::MockLogger::Scope logger_scope = vlt::MockLogger::inject();
};

TEST_F(BestEffort, succeeds_when_step_does_not_throw)
{
    auto called = false;
    const auto result = vl::best_effort("reinstall", "Re-applying remote display", [&called] { called = true; });

    EXPECT_TRUE(called);
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.diagnostic(), std::nullopt);
}

TEST_F(BestEffort, returns_step_result_unchanged)
{
    const auto result = vl::best_effort("reinstall", "Reserving address",
                                        [] { return vl::BestEffort::failed("no hardware address"); });

    EXPECT_FALSE(result.succeeded());
    EXPECT_THAT(result.diagnostic(), Optional(std::string{"no hardware address"}));
}

TEST_F(BestEffort, logs_and_reports_failure_when_step_throws)
{
    logger_scope.mock_logger->screen_logs(vll::Level::error);
    logger_scope.mock_logger->expect_log(vll::Level::warning, "Purging stale host key failed, continuing: denied");

    const auto result =
        vl::best_effort("reinstall", "Purging stale host key", [] { throw std::runtime_error{"denied"}; });

    EXPECT_FALSE(result.succeeded());
    EXPECT_THAT(result.diagnostic(), Optional(std::string{"Purging stale host key: denied"}));
}
} // namespace
