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

#include <inbox/contract/abi_encode.hpp>
#include <inbox/contract/abi_signatures.hpp>
#include <inbox/contract/big_endian.hpp>
#include <inbox/contract/checked_math.hpp>
#include <inbox/contract/events.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/byte_string.hpp>
#include <inbox/core/bytes.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace inbox;
using namespace evmc::literals;
using namespace intx::literals;

TEST(Events, signature)
{
    static_assert(
        abi_encode_event_signature("OwnerFunctionCalled(uint256)") ==
        0xea8787f128d10b2cc0317b0c3960f9ad447f7f6c1ed189db1083ccffd20f456e_bytes32);
    static_assert(
        abi_encode_event_signature(
            "MessageDelivered(uint256,bytes32,address,uint8,address,bytes32,"
            "uint256,uint64)") ==
        0x5e3c1311ea442664e8b1611bfabef659120ea7a0a2cfc0667700bebc69cbffe1_bytes32);
}

TEST(Events, build_batch_poster_event)
{
    // event BatchPosterSet(address indexed, bool)
    constexpr auto signature =
        0x28bcc5626d357efe966b4b0876aa1ee8ab99e26da4f131f6a2623f1800701c21_bytes32;
    auto const poster = Address{0xdeadbeef};

    constexpr auto expected_topic1 =
        0x00000000000000000000000000000000000000000000000000000000deadbeef_bytes32;
    byte_string const expected_data =
        evmc::from_hex(
            "0x0000000000000000000000000000000000000000000000000000000000000001")
            .value();

    auto const event =
        EventBuilder(Address{}, signature)
            .add_topic(abi_encode_address(poster))
            .add_data(abi_encode_bool(true))
            .build();
    ASSERT_EQ(event.topics.size(), 2);
    EXPECT_EQ(event.topics[0], signature);
    EXPECT_EQ(event.topics[1], expected_topic1);
    EXPECT_EQ(event.data, expected_data);
}

TEST(Events, dynamic_bytes_are_offset_and_padded)
{
    AbiEncoder encoder;
    encoder.add_uint(u64_be{7});
    encoder.add_bytes(evmc::from_hex("0xaabbcc").value());
    byte_string const encoded = encoder.encode_final();

    byte_string const expected =
        evmc::from_hex(
            "0x0000000000000000000000000000000000000000000000000000000000000007"
            "0000000000000000000000000000000000000000000000000000000000000040"
            "0000000000000000000000000000000000000000000000000000000000000003"
            "aabbcc0000000000000000000000000000000000000000000000000000000000")
            .value();
    EXPECT_EQ(encoded, expected);
}

TEST(CheckedMath, overflow_and_division)
{
    EXPECT_EQ(
        checked_mul(1_u256 << 200, 1_u256 << 56).assume_error(),
        MathError::Overflow);
    EXPECT_EQ(checked_mul(UINT256_MAX, 1).value(), UINT256_MAX);
    EXPECT_EQ(checked_mul(1_u256 << 200, 1_u256 << 55).value(), 1_u256 << 255);
    EXPECT_EQ(checked_div(7, 0).assume_error(), MathError::DivisionByZero);
    EXPECT_EQ(checked_div(7, 2).value(), 3);
}
