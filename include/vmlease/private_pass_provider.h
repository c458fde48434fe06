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

#ifndef VMLEASE_PRIVATE_PASS_PROVIDER_H
#define VMLEASE_PRIVATE_PASS_PROVIDER_H

namespace vmlease
{
/*
 * Lets a class expose a public function that only the class itself and its friends can call.
 * Inherit publicly using CRTP, require a PrivatePass in the guarded function, and hand the
 * `pass` token to friends.
 */
template <typename T>
class PrivatePassProvider
{
public:
    virtual ~PrivatePassProvider() = default;

    class PrivatePass
    {
    private:
        constexpr PrivatePass() = default;
        friend class PrivatePassProvider<T>;
    };

private:
    static constexpr const PrivatePass pass{}; // token to prove friendship
    friend T;
};
} // namespace vmlease

template <typename T>
constexpr const typename vmlease::PrivatePassProvider<T>::PrivatePass vmlease::PrivatePassProvider<T>::pass;

#endif // VMLEASE_PRIVATE_PASS_PROVIDER_H
