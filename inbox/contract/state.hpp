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

#include <inbox/contract/log.hpp>
#include <inbox/contract/version_stack.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <vector>

INBOX_NAMESPACE_BEGIN

// Versioned account storage and event log for a single execution context.
// push() opens a checkpoint; pop_accept() folds it into the parent and
// pop_reject() discards every write and log made since the matching push().
// Each slot keeps its own version stack, so a checkpoint costs only the
// slots it writes.
class State
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    using Slots = Map<bytes32_t, VersionStack<bytes32_t>>;

    struct SlotRef
    {
        Address address;
        bytes32_t key;
    };

    Map<Address, Slots> storage_{};

    // slots written under each open checkpoint, innermost last
    std::vector<std::vector<SlotRef>> journal_{};

    std::vector<Log> logs_{};

    // logs_.size() at each push()
    std::vector<size_t> log_marks_{};

public:
    State() = default;

    State(State &&) = delete;
    State(State const &) = delete;
    State &operator=(State &&) = delete;
    State &operator=(State const &) = delete;

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;

    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    void store_log(Log const &);

    std::vector<Log> const &logs() const;

    unsigned version() const noexcept
    {
        return static_cast<unsigned>(journal_.size());
    }

    // number of slots written under the innermost open checkpoint
    size_t dirty_slots() const;

    void push();

    void pop_accept();

    void pop_reject();
};

INBOX_NAMESPACE_END
