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
#include <inbox/contract/checked_math.hpp>
#include <inbox/core/keccak.hpp>
#include <inbox/core/likely.h>
#include <inbox/core/math.hpp>
#include <inbox/core/unaligned.hpp>
#include <inbox/sequencer/batch_header.hpp>
#include <inbox/sequencer/sequencer_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <bit>

INBOX_NAMESPACE_BEGIN

namespace
{
    struct PackedHeader
    {
        u64_be min_timestamp;
        u64_be max_timestamp;
        u64_be min_block_number;
        u64_be max_block_number;
        u64_be after_delayed_messages_read;
    };

    static_assert(sizeof(PackedHeader) == HEADER_LENGTH);
    static_assert(alignof(PackedHeader) == 1);
}

TimeBounds time_bounds(
    TimeVariation const &variation, uint64_t const block_number,
    uint64_t const timestamp)
{
    TimeBounds bounds;
    if (timestamp > variation.delay_seconds) {
        bounds.min_timestamp = timestamp - variation.delay_seconds;
    }
    bounds.max_timestamp = saturating_add(timestamp, variation.future_seconds);
    if (block_number > variation.delay_blocks) {
        bounds.min_block_number = block_number - variation.delay_blocks;
    }
    bounds.max_block_number =
        saturating_add(block_number, variation.future_blocks);
    return bounds;
}

BatchHeader encode_header(
    TimeBounds const &bounds, uint64_t const after_delayed_messages_read)
{
    PackedHeader const packed{
        .min_timestamp = bounds.min_timestamp,
        .max_timestamp = bounds.max_timestamp,
        .min_block_number = bounds.min_block_number,
        .max_block_number = bounds.max_block_number,
        .after_delayed_messages_read = after_delayed_messages_read};
    return std::bit_cast<BatchHeader>(packed);
}

Result<DecodedHeader> decode_header(byte_string_view const bytes)
{
    if (INBOX_UNLIKELY(bytes.size() != HEADER_LENGTH)) {
        return SequencerInboxError::InvalidHeaderLength;
    }
    auto const packed = unaligned_load<PackedHeader>(bytes.data());
    return DecodedHeader{
        .bounds =
            {.min_timestamp = packed.min_timestamp.native(),
             .max_timestamp = packed.max_timestamp.native(),
             .min_block_number = packed.min_block_number.native(),
             .max_block_number = packed.max_block_number.native()},
        .after_delayed_messages_read =
            packed.after_delayed_messages_read.native()};
}

bool is_valid_calldata_flag(uint8_t const flag)
{
    return flag == BROTLI_MESSAGE_HEADER_FLAG ||
           flag == DAS_MESSAGE_HEADER_FLAG ||
           flag == (DAS_MESSAGE_HEADER_FLAG | TREE_DAS_MESSAGE_HEADER_FLAG) ||
           flag == ZERO_HEAVY_MESSAGE_HEADER_FLAG;
}

Result<void>
validate_calldata(byte_string_view const data, size_t const max_data_size)
{
    if (INBOX_UNLIKELY(HEADER_LENGTH + data.size() > max_data_size)) {
        return SequencerInboxError::DataTooLarge;
    }
    if (!data.empty() && INBOX_UNLIKELY(!is_valid_calldata_flag(data[0]))) {
        return SequencerInboxError::InvalidHeaderFlag;
    }
    return outcome::success();
}

std::optional<bytes32_t> embedded_keyset_hash(byte_string_view const data)
{
    if (data.size() < 1 + sizeof(bytes32_t) ||
        !(data[0] & DAS_MESSAGE_HEADER_FLAG)) {
        return std::nullopt;
    }
    return to_bytes(data.substr(1, sizeof(bytes32_t)));
}

bytes32_t
calldata_hash(BatchHeader const &header, byte_string_view const data)
{
    byte_string preimage{header.data(), header.size()};
    preimage += data;
    return keccak256_bytes(preimage);
}

bytes32_t blob_hash(
    BatchHeader const &header, std::span<bytes32_t const> const blob_hashes)
{
    byte_string preimage{header.data(), header.size()};
    preimage.push_back(DATA_BLOB_HEADER_FLAG);
    for (auto const &hash : blob_hashes) {
        preimage += byte_string_view{hash.bytes, sizeof(hash.bytes)};
    }
    return keccak256_bytes(preimage);
}

bytes32_t empty_hash(BatchHeader const &header)
{
    return keccak256_bytes(to_byte_string_view(header));
}

bytes32_t keyset_hash(byte_string_view const keyset)
{
    byte_string preimage{0xfe};
    preimage += to_bytes(keccak256(keyset));
    bytes32_t hash = keccak256_bytes(preimage);
    hash.bytes[0] ^= 0x80;
    return hash;
}

Result<uint256_t> blob_extra_gas(
    uint256_t const &blob_base_fee, uint256_t const &base_fee,
    size_t const blob_count)
{
    if (base_fee == 0) {
        return uint256_t{0};
    }
    BOOST_OUTCOME_TRY(
        auto const blob_gas,
        checked_mul(uint256_t{GAS_PER_BLOB}, uint256_t{blob_count}));
    BOOST_OUTCOME_TRY(auto const blob_cost, checked_mul(blob_base_fee, blob_gas));
    return checked_div(blob_cost, base_fee);
}

INBOX_NAMESPACE_END
