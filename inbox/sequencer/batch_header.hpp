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

#include <inbox/core/byte_string.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>
#include <inbox/core/int.hpp>
#include <inbox/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

INBOX_NAMESPACE_BEGIN

inline constexpr size_t HEADER_LENGTH = 40;

// Leading byte of batch data. Inline data must start with one of the
// calldata flags; DATA_BLOB_HEADER_FLAG is reserved for blob digests.
inline constexpr uint8_t BROTLI_MESSAGE_HEADER_FLAG = 0x00;
inline constexpr uint8_t DAS_MESSAGE_HEADER_FLAG = 0x80;
inline constexpr uint8_t TREE_DAS_MESSAGE_HEADER_FLAG = 0x08;
inline constexpr uint8_t ZERO_HEAVY_MESSAGE_HEADER_FLAG = 0x20;
inline constexpr uint8_t DATA_AUTHENTICATED_FLAG = 0x40;
inline constexpr uint8_t DATA_BLOB_HEADER_FLAG = DATA_AUTHENTICATED_FLAG | 0x10;

inline constexpr uint64_t GAS_PER_BLOB = 1 << 17;

// Keysets of this size and above are rejected.
inline constexpr size_t MAX_KEYSET_SIZE = 64 * 1024;

struct TimeVariation
{
    uint64_t delay_blocks{};
    uint64_t future_blocks{};
    uint64_t delay_seconds{};
    uint64_t future_seconds{};

    friend bool operator==(TimeVariation const &, TimeVariation const &) =
        default;
};

struct TimeBounds
{
    uint64_t min_timestamp{};
    uint64_t max_timestamp{};
    uint64_t min_block_number{};
    uint64_t max_block_number{};

    friend bool operator==(TimeBounds const &, TimeBounds const &) = default;
};

enum class BatchDataLocation : uint8_t
{
    TxInput = 0,
    SeparateBatchEvent = 1,
    NoData = 2,
    Blob = 3,
};

using BatchHeader = byte_string_fixed<HEADER_LENGTH>;

struct DecodedHeader
{
    TimeBounds bounds;
    uint64_t after_delayed_messages_read;
};

TimeBounds time_bounds(
    TimeVariation const &, uint64_t block_number, uint64_t timestamp);

BatchHeader
encode_header(TimeBounds const &, uint64_t after_delayed_messages_read);

Result<DecodedHeader> decode_header(byte_string_view);

bool is_valid_calldata_flag(uint8_t);

// Size and leading-byte checks for inline batch data.
Result<void> validate_calldata(byte_string_view data, size_t max_data_size);

// The keyset hash carried by DAS data, if the data is long enough to hold one.
std::optional<bytes32_t> embedded_keyset_hash(byte_string_view data);

// keccak(header || data)
bytes32_t calldata_hash(BatchHeader const &, byte_string_view data);

// keccak(header || DATA_BLOB_HEADER_FLAG || blob_hashes...)
bytes32_t blob_hash(BatchHeader const &, std::span<bytes32_t const> blob_hashes);

// keccak(header)
bytes32_t empty_hash(BatchHeader const &);

// keccak(0xfe || keccak(keyset)) with the top bit flipped
bytes32_t keyset_hash(byte_string_view keyset);

// Blob gas expressed in units of execution gas at the current base fee.
// Zero when base_fee is zero.
Result<uint256_t> blob_extra_gas(
    uint256_t const &blob_base_fee, uint256_t const &base_fee,
    size_t blob_count);

INBOX_NAMESPACE_END
