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

#include <inbox/contract/storage_variable.hpp>
#include <inbox/core/assert.h>

#include <intx/intx.hpp>

INBOX_NAMESPACE_BEGIN

// Append-only array in account storage. The length lives at `slot`, the
// elements follow it.
template <typename T>
    requires std::has_unique_object_representations_v<T>
class StorageArray
{
    State &state_;
    Address const &address_;
    StorageVariable<u64_be> length_;
    uint256_t const start_index_;

    static constexpr size_t SLOT_PER_ELEM = StorageVariable<T>::N;

public:
    StorageArray(State &state, Address const &address, bytes32_t const &slot)
        : state_{state}
        , address_{address}
        , length_{state, address, slot}
        , start_index_{intx::be::load<uint256_t>(slot) + 1}
    {
    }

    uint64_t length() const
    {
        return length_.load().native();
    }

    bool empty() const
    {
        return length() == 0;
    }

    StorageVariable<T> get(uint64_t const index) const
    {
        INBOX_ASSERT(index < length());
        uint256_t const offset = start_index_ + index * SLOT_PER_ELEM;
        return StorageVariable<T>{state_, address_, offset};
    }

    void push(T const &value)
    {
        auto const len = length();
        uint256_t const offset = start_index_ + len * SLOT_PER_ELEM;
        StorageVariable<T>{state_, address_, offset}.store(value);
        length_.store(len + 1);
    }
};

INBOX_NAMESPACE_END
