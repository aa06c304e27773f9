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

#include <inbox/contract/big_endian.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/byte_string.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>
#include <inbox/core/int.hpp>
#include <inbox/core/math.hpp>
#include <inbox/core/unaligned.hpp>

#include <cstdint>
#include <cstring>
#include <utility>
#include <vector>

INBOX_NAMESPACE_BEGIN

// Solidity ABI encoding for event data.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
constexpr bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    unaligned_store(&output.bytes[12], address);
    return output;
}

template <BigEndianType I>
constexpr bytes32_t abi_encode_uint(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    unaligned_store(&output.bytes[offset], i);
    return output;
}

constexpr bytes32_t abi_encode_bool(bool const b)
{
    u8_be const as_int = b ? 1 : 0;
    return abi_encode_uint(as_int);
}

// Non-indexed event arguments. Words go in the head; bytes leave an offset in
// the head that encode_final() resolves once the head size is known.
class AbiEncoder
{
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(bytes32_t const &data)
    {
        head_ += data;
    }

public:
    template <BigEndianType I>
    void add_uint(I const &i)
    {
        add_static(abi_encode_uint(i));
    }

    void add_bytes32(bytes32_t const &b)
    {
        add_static(b);
    }

    // Batch data and keysets, length-prefixed and zero-padded to a word.
    void add_bytes(byte_string_view const data)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        head_ += bytes32_t{};
        tail_ += abi_encode_uint(u256_be{data.size()});
        tail_ += data;
        tail_.append(round_up(data.size(), sizeof(bytes32_t)) - data.size(), 0);
    }

    byte_string encode_final()
    {
        for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
            u256_be const offset =
                static_cast<uint256_t>(head_.size() + tail_cumsum);
            bytes32_t const encoded = abi_encode_uint(offset);
            std::memcpy(&head_[unresolved], encoded.bytes, sizeof(bytes32_t));
        }

        return std::move(head_) + std::move(tail_);
    }
};

INBOX_NAMESPACE_END
