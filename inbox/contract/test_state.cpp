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

#include <inbox/contract/log.hpp>
#include <inbox/contract/state.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/bytes.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace inbox;
using namespace evmc::literals;

namespace
{
    constexpr auto A{0x5353535353535353535353535353535353535353_address};
    constexpr auto B{0xbebebebebebebebebebebebebebebebebebebebe_address};
    constexpr auto KEY1{
        0x00000000000000000000000000000000000000000000000000000000cafebabe_bytes32};
    constexpr auto KEY2{
        0x1234567890123456789012345678901234567890123456789012345678901234_bytes32};
    constexpr auto VALUE1{
        0x0000000000000013370000000000000000000000000000000000000000000003_bytes32};
    constexpr auto VALUE2{
        0x0000000000000000000000000000000000000000000000000000000000000007_bytes32};
}

TEST(State, missing_storage_reads_zero)
{
    State state;
    EXPECT_EQ(state.get_storage(A, KEY1), bytes32_t{});
    state.set_storage(A, KEY1, VALUE1);
    EXPECT_EQ(state.get_storage(A, KEY1), VALUE1);
    EXPECT_EQ(state.get_storage(A, KEY2), bytes32_t{});
    EXPECT_EQ(state.get_storage(B, KEY1), bytes32_t{});
}

TEST(State, pop_accept_keeps_writes)
{
    State state;
    state.set_storage(A, KEY1, VALUE1);

    state.push();
    state.set_storage(A, KEY1, VALUE2);
    state.set_storage(B, KEY2, VALUE1);
    state.store_log(Log{.data = {}, .topics = {KEY1}, .address = A});
    state.pop_accept();

    EXPECT_EQ(state.version(), 0);
    EXPECT_EQ(state.get_storage(A, KEY1), VALUE2);
    EXPECT_EQ(state.get_storage(B, KEY2), VALUE1);
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].address, A);
}

TEST(State, pop_reject_discards_writes_and_logs)
{
    State state;
    state.set_storage(A, KEY1, VALUE1);
    state.store_log(Log{.data = {}, .topics = {KEY2}, .address = A});

    state.push();
    state.set_storage(A, KEY1, VALUE2);
    state.set_storage(A, KEY2, VALUE2);
    state.set_storage(B, KEY1, VALUE1);
    state.store_log(Log{.data = {}, .topics = {KEY1}, .address = B});
    EXPECT_EQ(state.logs().size(), 2);
    state.pop_reject();

    EXPECT_EQ(state.get_storage(A, KEY1), VALUE1);
    EXPECT_EQ(state.get_storage(A, KEY2), bytes32_t{});
    EXPECT_EQ(state.get_storage(B, KEY1), bytes32_t{});
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].topics[0], KEY2);
}

TEST(State, nested_checkpoints)
{
    State state;

    state.push();
    state.set_storage(A, KEY1, VALUE1);

    state.push();
    state.set_storage(A, KEY1, VALUE2);
    state.pop_reject();
    EXPECT_EQ(state.get_storage(A, KEY1), VALUE1);

    state.push();
    state.set_storage(A, KEY2, VALUE2);
    state.pop_accept();
    EXPECT_EQ(state.get_storage(A, KEY2), VALUE2);

    state.pop_reject();
    EXPECT_EQ(state.get_storage(A, KEY1), bytes32_t{});
    EXPECT_EQ(state.get_storage(A, KEY2), bytes32_t{});
    EXPECT_EQ(state.version(), 0);
}

TEST(State, zero_write_clears_slot)
{
    State state;
    state.set_storage(A, KEY1, VALUE1);
    state.push();
    state.set_storage(A, KEY1, bytes32_t{});
    EXPECT_EQ(state.get_storage(A, KEY1), bytes32_t{});
    state.pop_reject();
    EXPECT_EQ(state.get_storage(A, KEY1), VALUE1);
}

TEST(State, checkpoint_tracks_only_written_slots)
{
    State state;
    for (uint64_t i = 0; i < 1000; ++i) {
        state.set_storage(A, bytes32_t{i + 1}, VALUE1);
    }

    state.push();
    state.set_storage(A, KEY1, VALUE2);
    state.set_storage(A, KEY1, VALUE1);
    EXPECT_EQ(state.dirty_slots(), 1);

    state.push();
    state.set_storage(A, bytes32_t{1}, VALUE2);
    state.set_storage(B, KEY2, VALUE2);
    EXPECT_EQ(state.dirty_slots(), 2);
    state.pop_accept();
    EXPECT_EQ(state.get_storage(A, bytes32_t{1}), VALUE2);

    state.pop_reject();
    EXPECT_EQ(state.get_storage(A, KEY1), bytes32_t{});
    EXPECT_EQ(state.get_storage(A, bytes32_t{1}), VALUE1);
    EXPECT_EQ(state.get_storage(A, bytes32_t{1000}), VALUE1);
    EXPECT_EQ(state.get_storage(B, KEY2), bytes32_t{});
    EXPECT_EQ(state.version(), 0);
}
