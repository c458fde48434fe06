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

#include <vmlease/ip_address.h>

namespace vl = vmlease;
using namespace testing;

TEST(IPAddress, can_initialize_from_string)
{
    vl::IPAddress ip{"192.168.119.50"};

    EXPECT_THAT(ip.octets[0], Eq(192));
    EXPECT_THAT(ip.octets[1], Eq(168));
    EXPECT_THAT(ip.octets[2], Eq(119));
    EXPECT_THAT(ip.octets[3], Eq(50));
}

TEST(IPAddress, throws_on_invalid_ip_string)
{
    EXPECT_THROW(vl::IPAddress ip{"100111.3434.3"}, std::invalid_argument);
    EXPECT_THROW(vl::IPAddress ip{"256.256.256.256"}, std::invalid_argument);
    EXPECT_THROW(vl::IPAddress ip{"-2.-3.-5.-6"}, std::invalid_argument);
    EXPECT_THROW(vl::IPAddress ip{"a.b.c.d"}, std::invalid_argument);
    EXPECT_THROW(vl::IPAddress ip{""}, std::invalid_argument);
    EXPECT_THROW(vl::IPAddress ip{"192.168.1.3 "}, std::invalid_argument);
}
