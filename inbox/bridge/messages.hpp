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
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>
#include <inbox/core/int.hpp>

#include <cstdint>

INBOX_NAMESPACE_BEGIN

// Kinds of delayed message understood by the child chain.
enum MessageKind : uint8_t
{
    L2Message = 3,
    EndOfBlock = 6,
    L2FundedByL1 = 7,
    RollupEvent = 8,
    SubmitRetryable = 9,
    BatchForGasEstimation = 10,
    Initialize = 11,
    EthDeposit = 12,
    BatchPostingReport = 13,
    Invalid = 0xFF,
};

struct DelayedMessage
{
    uint8_t kind{};
    Address sender{};
    uint64_t block_number{};
    uint64_t timestamp{};
    uint256_t inbox_seq_num{};
    uint256_t base_fee_l1{};
    bytes32_t message_data_hash{};

    friend bool operator==(DelayedMessage const &, DelayedMessage const &) =
        default;
};

// keccak(kind || sender || block_number || timestamp || inbox_seq_num ||
//        base_fee_l1 || message_data_hash), tightly packed
bytes32_t message_hash(DelayedMessage const &);

// keccak(prev_acc || message_hash)
bytes32_t accumulate_message(bytes32_t const &prev_acc, bytes32_t const &);

// keccak(before_acc || data_hash || delayed_acc)
bytes32_t accumulate_sequencer_message(
    bytes32_t const &before_acc, bytes32_t const &data_hash,
    bytes32_t const &delayed_acc);

INBOX_NAMESPACE_END
