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
#include "mock_utils.h"

#include <vmlease/utils.h>

#include <QByteArray>

namespace vl = vmlease;
namespace vlu = vmlease::utils;
namespace vlt = vmlease::test;
using namespace testing;
using namespace std::chrono_literals;

namespace
{
TEST(Utils, splits_output_into_trimmed_lines)
{
    const QByteArray output{"Total running VMs: 1\r\n  /vms/tenant-vm.vmx  \n\n"};

    EXPECT_EQ(vlu::split_lines(output), (QStringList{"Total running VMs: 1", "/vms/tenant-vm.vmx"}));
    EXPECT_TRUE(vlu::split_lines("").isEmpty());
}

TEST(Utils, validates_ipv4_addresses)
{
    EXPECT_TRUE(VL_UTILS.is_ipv4_valid("192.168.119.50"));
    EXPECT_FALSE(VL_UTILS.is_ipv4_valid("192.168.119"));
    EXPECT_FALSE(VL_UTILS.is_ipv4_valid("192.168.119.256"));
    EXPECT_FALSE(VL_UTILS.is_ipv4_valid("unknown"));
}

struct RetryFor : public Test
{
    const vlt::MockUtils::GuardedMock utils_injection = vlt::MockUtils::inject<NiceMock>();
    vlt::MockUtils* mock_utils = utils_injection.first;
};

TEST_F(RetryFor, stops_as_soon_as_action_is_done)
{
    EXPECT_CALL(*mock_utils, sleep_for(Eq(5s))).Times(2);

    auto calls = 0;
    const auto result = vlu::retry_for(10, 5s, [&calls](int attempt) {
        ++calls;
        EXPECT_EQ(attempt, calls);
        return attempt == 3 ? vlu::TimeoutAction::done : vlu::TimeoutAction::retry;
    });

    EXPECT_EQ(result.attempts, 3);
    EXPECT_FALSE(result.exhausted);
}

TEST_F(RetryFor, does_not_sleep_after_last_attempt)
{
    EXPECT_CALL(*mock_utils, sleep_for(_)).Times(3);

    const auto result = vlu::retry_for(4, 1s, [](int) { return vlu::TimeoutAction::retry; });

    EXPECT_EQ(result.attempts, 4);
    EXPECT_TRUE(result.exhausted);
}

TEST_F(RetryFor, does_not_sleep_when_first_attempt_succeeds)
{
    EXPECT_CALL(*mock_utils, sleep_for(_)).Times(0);

    const auto result = vlu::retry_for(60, 5s, [](int) { return vlu::TimeoutAction::done; });

    EXPECT_EQ(result.attempts, 1);
    EXPECT_FALSE(result.exhausted);
}

TEST_F(RetryFor, makes_no_attempt_when_none_are_allowed)
{
    auto called = false;
    const auto result = vlu::retry_for(0, 5s, [&called](int) {
        called = true;
        return vlu::TimeoutAction::done;
    });

    EXPECT_FALSE(called);
    EXPECT_EQ(result.attempts, 0);
    EXPECT_TRUE(result.exhausted);
}
} // namespace
