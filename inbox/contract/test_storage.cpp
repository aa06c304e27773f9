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

#include <inbox/contract/big_endian.hpp>
#include <inbox/contract/state.hpp>
#include <inbox/contract/storage_array.hpp>
#include <inbox/contract/storage_variable.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/bytes.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace inbox;
using namespace evmc::literals;
using namespace intx::literals;

struct Storage : public ::testing::Test
{
    static constexpr auto ADDRESS{
        0x36928500bc1dcd7af6a2b4008875cc336b927d57_address};
    State state;
};

TEST_F(Storage, variable)
{
    StorageVariable<u256_be> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(5_u256);
    ASSERT_TRUE(var.load_checked().has_value());
    EXPECT_EQ(var.load().native(), 5_u256);
    var.store(2000_u256);
    EXPECT_EQ(var.load().native(), 2000_u256);
    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
}

TEST_F(Storage, multi_slot_struct)
{
    struct Window
    {
        u64_be lo;
        u64_be hi;
        bytes32_t root;
        u64_be count;
    };

    static_assert(StorageVariable<Window>::N == 3);

    constexpr auto ROOT{
        0xabababababababababababababababababababababababababababababababab_bytes32};

    StorageVariable<Window> var(state, ADDRESS, bytes32_t{6000});
    ASSERT_FALSE(var.load_checked().has_value());
    var.store(Window{.lo = 4, .hi = 5, .root = ROOT, .count = 9});
    ASSERT_TRUE(var.load_checked().has_value());

    Window const w = var.load();
    EXPECT_EQ(w.lo.native(), 4);
    EXPECT_EQ(w.hi.native(), 5);
    EXPECT_EQ(w.root, ROOT);
    EXPECT_EQ(w.count.native(), 9);

    // neighbouring slots are untouched
    StorageVariable<u64_be> const before(state, ADDRESS, bytes32_t{5999});
    StorageVariable<u64_be> const after(state, ADDRESS, bytes32_t{6003});
    EXPECT_FALSE(before.load_checked().has_value());
    EXPECT_FALSE(after.load_checked().has_value());

    var.clear();
    EXPECT_FALSE(var.load_checked().has_value());
}

TEST_F(Storage, array)
{
    StorageArray<bytes32_t> arr(state, ADDRESS, bytes32_t{100});
    EXPECT_TRUE(arr.empty());

    for (uint64_t i = 0; i < 100; ++i) {
        arr.push(to_bytes(uint256_t{i + 1}));
        EXPECT_EQ(arr.length(), i + 1);
    }

    for (uint64_t i = 0; i < 100; ++i) {
        EXPECT_EQ(arr.get(i).load(), to_bytes(uint256_t{i + 1}));
    }
}

TEST_F(Storage, array_rolls_back_with_state)
{
    StorageArray<bytes32_t> arr(state, ADDRESS, bytes32_t{100});
    arr.push(bytes32_t{1});

    state.push();
    arr.push(bytes32_t{2});
    EXPECT_EQ(arr.length(), 2);
    state.pop_reject();

    EXPECT_EQ(arr.length(), 1);
    EXPECT_EQ(arr.get(0).load(), bytes32_t{1});
}
