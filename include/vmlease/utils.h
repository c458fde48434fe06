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

#ifndef VMLEASE_UTILS_H
#define VMLEASE_UTILS_H

#include <vmlease/singleton.h>

#include <chrono>
#include <string>
#include <type_traits>

#include <QDateTime>
#include <QString>
#include <QStringList>

#define VL_UTILS vmlease::Utils::instance()

namespace vmlease
{
namespace utils
{

enum class TimeoutAction
{
    retry,
    done
};

// Outcome of retry_for. `exhausted` is only set when every attempt asked to retry.
struct RetryResult
{
    int attempts{0};
    bool exhausted{false};
};

// string helpers
QStringList split_lines(const QByteArray& output);

// Call try_action(attempt) up to max_attempts times, sleeping for interval between attempts,
// until it returns TimeoutAction::done.
template <typename TryAction>
RetryResult retry_for(int max_attempts, std::chrono::milliseconds interval, TryAction&& try_action);
} // namespace utils

class Utils : public Singleton<Utils>
{
public:
    Utils(const Singleton<Utils>::PrivatePass&) noexcept;

    virtual void sleep_for(const std::chrono::milliseconds& ms) const;
    virtual bool is_ipv4_valid(const std::string& ipv4) const;
    virtual QDateTime current_date_time() const;
};
} // namespace vmlease

template <typename TryAction>
vmlease::utils::RetryResult vmlease::utils::retry_for(int max_attempts, std::chrono::milliseconds interval,
                                                      TryAction&& try_action)
{
    static_assert(std::is_same<decltype(try_action(1)), TimeoutAction>::value, "");

    RetryResult result;
    while (result.attempts < max_attempts)
    {
        ++result.attempts;
        if (try_action(result.attempts) == TimeoutAction::done)
            return result;

        if (result.attempts < max_attempts)
            VL_UTILS.sleep_for(interval); // mock this to avoid sleeping in tests
    }

    result.exhausted = true;
    return result;
}

#endif // VMLEASE_UTILS_H
