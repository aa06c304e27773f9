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

#include <inbox/bridge/messages.hpp>
#include <inbox/contract/big_endian.hpp>
#include <inbox/core/byte_string.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/keccak.hpp>

#include <array>
#include <bit>

INBOX_NAMESPACE_BEGIN

namespace
{
    struct PackedMessage
    {
        u8_be kind;
        Address sender;
        u64_be block_number;
        u64_be timestamp;
        u256_be inbox_seq_num;
        u256_be base_fee_l1;
        bytes32_t message_data_hash;
    };

    static_assert(sizeof(PackedMessage) == 133);
    static_assert(alignof(PackedMessage) == 1);

    template <size_t N>
    bytes32_t hash_concat(std::array<bytes32_t, N> const &words)
    {
        auto const packed =
            std::bit_cast<std::array<unsigned char, N * sizeof(bytes32_t)>>(
                words);
        return keccak256_bytes({packed.data(), packed.size()});
    }
}

bytes32_t message_hash(DelayedMessage const &msg)
{
    PackedMessage const packed{
        .kind = msg.kind,
        .sender = msg.sender,
        .block_number = msg.block_number,
        .timestamp = msg.timestamp,
        .inbox_seq_num = msg.inbox_seq_num,
        .base_fee_l1 = msg.base_fee_l1,
        .message_data_hash = msg.message_data_hash};
    auto const bytes =
        std::bit_cast<std::array<unsigned char, sizeof(PackedMessage)>>(
            packed);
    return keccak256_bytes({bytes.data(), bytes.size()});
}

bytes32_t
accumulate_message(bytes32_t const &prev_acc, bytes32_t const &msg_hash)
{
    return hash_concat(std::array{prev_acc, msg_hash});
}

bytes32_t accumulate_sequencer_message(
    bytes32_t const &before_acc, bytes32_t const &data_hash,
    bytes32_t const &delayed_acc)
{
    return hash_concat(std::array{before_acc, data_hash, delayed_acc});
}

INBOX_NAMESPACE_END
