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
#include <vmlease/utils.h>

#include <QByteArray>

#include <stdexcept>
#include <thread>

namespace vl = vmlease;
namespace vlu = vmlease::utils;

QStringList vlu::split_lines(const QByteArray& output)
{
    QStringList lines;
    for (const auto& line : QString::fromUtf8(output).split('\n'))
    {
        auto trimmed = line.trimmed();
        if (!trimmed.isEmpty())
            lines << trimmed;
    }

    return lines;
}

vl::Utils::Utils(const Singleton<Utils>::PrivatePass& pass) noexcept : Singleton<Utils>::Singleton{pass}
{
}

void vl::Utils::sleep_for(const std::chrono::milliseconds& ms) const
{
    std::this_thread::sleep_for(ms);
}

bool vl::Utils::is_ipv4_valid(const std::string& ipv4) const
{
    try
    {
        (vl::IPAddress(ipv4));
    }
    catch (std::invalid_argument&)
    {
        return false;
    }

    return true;
}

QDateTime vl::Utils::current_date_time() const
{
    return QDateTime::currentDateTimeUtc();
}
