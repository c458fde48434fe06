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

#include <vmlease/ip_address.h>

#include <QRegularExpression>
#include <QString>

#include <stdexcept>

namespace vl = vmlease;

namespace
{
std::array<uint8_t, 4> parse(const std::string& ip)
{
    static const QRegularExpression ipv4_re{R"(^(\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3})$)"};

    const auto match = ipv4_re.match(QString::fromStdString(ip));
    if (!match.hasMatch())
        throw std::invalid_argument("invalid IPv4 address");

    std::array<uint8_t, 4> octets{};
    for (int i = 0; i < 4; ++i)
    {
        const auto value = match.captured(i + 1).toInt();
        if (value > 255)
            throw std::invalid_argument("invalid IP octet");
        octets[i] = static_cast<uint8_t>(value);
    }

    return octets;
}
} // namespace

vl::IPAddress::IPAddress(const std::string& ip) : octets{parse(ip)}
{
}
