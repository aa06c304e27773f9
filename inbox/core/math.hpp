// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <inbox/core/config.hpp>

#include <concepts>
#include <limits>

INBOX_NAMESPACE_BEGIN

template <std::unsigned_integral T>
[[gnu::always_inline]] constexpr T round_up(T const x, T const y)
{
    T z = x + (y - 1);
    z /= y;
    z *= y;
    return z;
}

template <std::unsigned_integral T>
[[gnu::always_inline]] constexpr T saturating_add(T const x, T const y)
{
    return x > std::numeric_limits<T>::max() - y ? std::numeric_limits<T>::max()
                                                 : x + y;
}

template <std::unsigned_integral T>
[[gnu::always_inline]] constexpr T saturating_sub(T const x, T const y)
{
    return x > y ? x - y : 0;
}

INBOX_NAMESPACE_END
