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

#include <inbox/bridge/messages.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>
#include <inbox/core/result.hpp>

#include <cstdint>

INBOX_NAMESPACE_BEGIN

class IBridge;

// Preimage of a delayed accumulator entry: the accumulator before the message
// and the message itself.
struct DelayProof
{
    bytes32_t before_delayed_acc{};
    DelayedMessage delayed_message{};
};

// Proves the first unread delayed message and, once the batch is enqueued,
// the last message the batch reads.
struct ResyncProof
{
    DelayProof first{};
    DelayProof last{};
};

// keccak(proof.before_delayed_acc || message_hash(proof.delayed_message))
// == target
bool is_valid_preimage(DelayProof const &, bytes32_t const &target);

// Checks the proof against the ledger accumulator at `index`.
Result<void>
verify_delay_proof(IBridge const &, uint64_t index, DelayProof const &);

// Checks the proof against an accumulator value returned by the ledger.
Result<void>
verify_delay_proof(bytes32_t const &delayed_acc, DelayProof const &);

INBOX_NAMESPACE_END
