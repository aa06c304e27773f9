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

#include <inbox/core/byte_string.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/int.hpp>
#include <inbox/sequencer/batch_header.hpp>
#include <inbox/sequencer/sequencer_error.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <limits>
#include <vector>

using namespace inbox;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr TimeBounds BOUNDS{
        .min_timestamp = 1,
        .max_timestamp = 2,
        .min_block_number = 3,
        .max_block_number = 4};
}

TEST(BatchHeader, encode_is_packed_big_endian)
{
    BatchHeader const header = encode_header(BOUNDS, 5);
    byte_string const expected{
        0, 0, 0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 2, 0, 0, 0, 0,
        0, 0, 0, 3, 0, 0, 0, 0, 0, 0, 0, 4, 0, 0, 0, 0, 0, 0, 0, 5};
    EXPECT_EQ(byte_string(header.data(), header.size()), expected);
}

TEST(BatchHeader, decode)
{
    BatchHeader const header = encode_header(BOUNDS, 5);
    auto const decoded = decode_header(to_byte_string_view(header));
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value().bounds, BOUNDS);
    EXPECT_EQ(decoded.value().after_delayed_messages_read, 5);

    auto const truncated =
        decode_header(to_byte_string_view(header).substr(0, 39));
    ASSERT_TRUE(truncated.has_error());
    EXPECT_EQ(
        truncated.assume_error(), SequencerInboxError::InvalidHeaderLength);
}

TEST(BatchHeader, time_bounds)
{
    TimeVariation const variation{
        .delay_blocks = 10,
        .future_blocks = 4,
        .delay_seconds = 120,
        .future_seconds = 48};

    auto const bounds = time_bounds(variation, 100, 1000);
    EXPECT_EQ(bounds.min_block_number, 90);
    EXPECT_EQ(bounds.max_block_number, 104);
    EXPECT_EQ(bounds.min_timestamp, 880);
    EXPECT_EQ(bounds.max_timestamp, 1048);

    // lower bounds clamp at zero
    auto const early = time_bounds(variation, 5, 100);
    EXPECT_EQ(early.min_block_number, 0);
    EXPECT_EQ(early.min_timestamp, 0);

    // upper bounds saturate
    constexpr auto max = std::numeric_limits<uint64_t>::max();
    auto const late = time_bounds(variation, max - 1, max - 1);
    EXPECT_EQ(late.max_block_number, max);
    EXPECT_EQ(late.max_timestamp, max);
}

TEST(BatchHeader, digests)
{
    BatchHeader const header = encode_header(BOUNDS, 5);

    EXPECT_EQ(
        empty_hash(header),
        0x7f98e7b359d7f46576ae26512a6f46829f9ed59d98635f860619008a337934df_bytes32);

    byte_string const data{0x00, 0xaa, 0xbb};
    EXPECT_EQ(
        calldata_hash(header, data),
        0x3b75b28b41aa13d4dbfa20bf9eaf818ddf992732871716328bc1b7cf62d2951d_bytes32);

    std::vector<bytes32_t> const blobs{
        0x1111111111111111111111111111111111111111111111111111111111111111_bytes32,
        0x2222222222222222222222222222222222222222222222222222222222222222_bytes32};
    EXPECT_EQ(
        blob_hash(header, blobs),
        0xff2a8f4c55077671afe83a62bb3611a7a9ef84e95f87ea45e371f64492c777ce_bytes32);

    // the digest binds the header
    EXPECT_NE(
        calldata_hash(encode_header(BOUNDS, 6), data),
        calldata_hash(header, data));
}

TEST(BatchHeader, calldata_flags)
{
    EXPECT_TRUE(is_valid_calldata_flag(BROTLI_MESSAGE_HEADER_FLAG));
    EXPECT_TRUE(is_valid_calldata_flag(DAS_MESSAGE_HEADER_FLAG));
    EXPECT_TRUE(is_valid_calldata_flag(
        DAS_MESSAGE_HEADER_FLAG | TREE_DAS_MESSAGE_HEADER_FLAG));
    EXPECT_TRUE(is_valid_calldata_flag(ZERO_HEAVY_MESSAGE_HEADER_FLAG));

    EXPECT_FALSE(is_valid_calldata_flag(DATA_BLOB_HEADER_FLAG));
    EXPECT_FALSE(is_valid_calldata_flag(DATA_AUTHENTICATED_FLAG));
    EXPECT_FALSE(is_valid_calldata_flag(TREE_DAS_MESSAGE_HEADER_FLAG));
    EXPECT_FALSE(is_valid_calldata_flag(0xff));
}

TEST(BatchHeader, validate_calldata)
{
    EXPECT_FALSE(validate_calldata({}, HEADER_LENGTH).has_error());

    byte_string const blob_flagged{DATA_BLOB_HEADER_FLAG, 0x01};
    auto const res = validate_calldata(blob_flagged, 1000);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), SequencerInboxError::InvalidHeaderFlag);

    byte_string const brotli(60, 0x00);
    EXPECT_FALSE(validate_calldata(brotli, 100).has_error());
    auto const too_large = validate_calldata(brotli, 99);
    ASSERT_TRUE(too_large.has_error());
    EXPECT_EQ(too_large.assume_error(), SequencerInboxError::DataTooLarge);
}

TEST(BatchHeader, embedded_keyset_hash)
{
    auto const hash =
        0xabababababababababababababababababababababababababababababababab_bytes32;

    byte_string das{DAS_MESSAGE_HEADER_FLAG};
    das += hash;
    das.push_back(0x01);
    ASSERT_TRUE(embedded_keyset_hash(das).has_value());
    EXPECT_EQ(embedded_keyset_hash(das).value(), hash);

    // too short to carry a hash
    EXPECT_FALSE(embedded_keyset_hash(das.substr(0, 32)).has_value());

    byte_string brotli{BROTLI_MESSAGE_HEADER_FLAG};
    brotli += hash;
    EXPECT_FALSE(embedded_keyset_hash(brotli).has_value());
}

TEST(BatchHeader, keyset_hash)
{
    byte_string const keyset{0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(
        keyset_hash(keyset),
        0x7291b0f054da350163e27bb027bd4dae806fdbd74fe65b86b5147ede78a33204_bytes32);
}

TEST(BatchHeader, blob_extra_gas)
{
    auto const gas = blob_extra_gas(10, 5, 2);
    ASSERT_FALSE(gas.has_error());
    EXPECT_EQ(gas.value(), uint256_t{GAS_PER_BLOB} * 2 * 10 / 5);

    auto const free = blob_extra_gas(10, 0, 2);
    ASSERT_FALSE(free.has_error());
    EXPECT_EQ(free.value(), 0);

    EXPECT_TRUE(blob_extra_gas(UINT256_MAX, 1, 2).has_error());
}
