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

#include <inbox/core/assert.h>
#include <inbox/core/byte_string.hpp>
#include <inbox/core/int.hpp>
#include <inbox/core/keccak.hpp>

#include <evmc/evmc.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>

INBOX_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

using namespace evmc::literals;

constexpr bytes32_t to_bytes(uint256_t const n) noexcept
{
    return std::bit_cast<bytes32_t>(n);
}

constexpr bytes32_t to_bytes(hash256 const n) noexcept
{
    return std::bit_cast<bytes32_t>(n);
}

// Right-aligns up to 32 bytes, as a big-endian number would be.
constexpr bytes32_t to_bytes(byte_string_view const data) noexcept
{
    INBOX_ASSERT(data.size() <= sizeof(bytes32_t));

    bytes32_t byte;
    std::copy_n(
        data.begin(),
        data.size(),
        byte.bytes + sizeof(bytes32_t) - data.size());
    return byte;
}

inline bytes32_t keccak256_bytes(byte_string_view const data)
{
    return to_bytes(keccak256(data));
}

INBOX_NAMESPACE_END
