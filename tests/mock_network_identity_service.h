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

#ifndef VMLEASE_MOCK_NETWORK_IDENTITY_SERVICE_H
#define VMLEASE_MOCK_NETWORK_IDENTITY_SERVICE_H

#include "common.h"

#include <vmlease/network_identity_service.h>

namespace vmlease::test
{
class MockNetworkIdentityService : public NetworkIdentityService
{
public:
    MOCK_METHOD(void, reserve, (const std::string&, const std::string&, const std::string&), (override));
};
} // namespace vmlease::test

#endif // VMLEASE_MOCK_NETWORK_IDENTITY_SERVICE_H
