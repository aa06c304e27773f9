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
#include <inbox/contract/storage_array.hpp>
#include <inbox/contract/storage_variable.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>
#include <inbox/core/int.hpp>
#include <inbox/core/result.hpp>

#include <evmc/evmc.h>

#include <cstdint>

INBOX_NAMESPACE_BEGIN

class State;

struct SequencerMessageEnqueued
{
    uint64_t seq_message_index;
    bytes32_t before_acc;
    bytes32_t delayed_acc;
    bytes32_t acc;
};

// The accumulator ledger. Owns the delayed and sequencer hash chains and
// their counters; the sequencer inbox only mutates them through the enqueue
// calls.
class IBridge
{
public:
    virtual ~IBridge() = default;

    // Appends keccak(before_acc || data_hash || delayed_acc) to the sequencer
    // chain, where delayed_acc is the delayed accumulator at
    // after_delayed_messages_read - 1. Fails unless prev_message_count is the
    // currently reported sub-message count.
    virtual Result<SequencerMessageEnqueued> enqueue_sequencer_message(
        bytes32_t const &data_hash, uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count) = 0;

    // Enqueues a batch posting report as a delayed message. Returns the
    // delayed message number.
    virtual Result<uint64_t> submit_batch_spending_report(
        Address const &sender, bytes32_t const &message_data_hash,
        evmc_tx_context const &) = 0;

    virtual Result<uint64_t> enqueue_delayed_message(
        uint8_t kind, Address const &sender,
        bytes32_t const &message_data_hash, evmc_tx_context const &) = 0;

    virtual uint64_t delayed_message_count() const = 0;
    virtual uint64_t sequencer_message_count() const = 0;
    virtual uint64_t total_delayed_messages_read() const = 0;
    virtual uint256_t sequencer_reported_sub_message_count() const = 0;

    virtual Result<bytes32_t> delayed_inbox_accs(uint64_t index) const = 0;
    virtual Result<bytes32_t> sequencer_inbox_accs(uint64_t index) const = 0;

    virtual Address rollup() const = 0;
};

// IBridge over account storage at `address`.
class Bridge final : public IBridge
{
    State &state_;
    Address const address_;

    class Variables
    {
        State &state_;
        Address const &address_;

        static constexpr auto AddressTotalDelayedMessagesRead{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressReportedSubMessageCount{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressRollup{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
        static constexpr auto AddressSequencerInbox{
            0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};
        static constexpr auto AddressDelayedInbox{
            0x0000000000000000000000000000000000000000000000000000000000000005_bytes32};

        // each accumulator chain owns the address space under its namespace
        static constexpr auto AddressDelayedInboxAccs{
            0x0100000000000000000000000000000000000000000000000000000000000000_bytes32};
        static constexpr auto AddressSequencerInboxAccs{
            0x0200000000000000000000000000000000000000000000000000000000000000_bytes32};

    public:
        Variables(State &state, Address const &address)
            : state_{state}
            , address_{address}
        {
        }

        StorageVariable<u64_be> total_delayed_messages_read{
            state_, address_, AddressTotalDelayedMessagesRead};

        StorageVariable<u256_be> sequencer_reported_sub_message_count{
            state_, address_, AddressReportedSubMessageCount};

        StorageVariable<Address> rollup{state_, address_, AddressRollup};

        // inbox recorded in MessageDelivered for spending reports
        StorageVariable<Address> sequencer_inbox{
            state_, address_, AddressSequencerInbox};

        // inbox recorded in MessageDelivered for other delayed messages
        StorageVariable<Address> delayed_inbox{
            state_, address_, AddressDelayedInbox};

        StorageArray<bytes32_t> delayed_inbox_accs{
            state_, address_, AddressDelayedInboxAccs};

        StorageArray<bytes32_t> sequencer_inbox_accs{
            state_, address_, AddressSequencerInboxAccs};
    } vars;

    uint64_t enqueue_delayed(
        uint8_t kind, Address const &sender,
        bytes32_t const &message_data_hash, Address const &inbox,
        evmc_tx_context const &);

    // event MessageDelivered(
    //     uint256 indexed messageIndex,
    //     bytes32 indexed beforeInboxAcc,
    //     address         inbox,
    //     uint8           kind,
    //     address         sender,
    //     bytes32         messageDataHash,
    //     uint256         baseFeeL1,
    //     uint64          timestamp);
    void emit_message_delivered(
        uint64_t message_index, bytes32_t const &before_inbox_acc,
        Address const &inbox, uint8_t kind, Address const &sender,
        bytes32_t const &message_data_hash, uint256_t const &base_fee_l1,
        uint64_t timestamp);

public:
    Bridge(State &, Address const &address, Address const &rollup);

    Address const &address() const noexcept
    {
        return address_;
    }

    void set_sequencer_inbox(Address const &);
    void set_delayed_inbox(Address const &);
    void update_rollup_address(Address const &);

    Result<SequencerMessageEnqueued> enqueue_sequencer_message(
        bytes32_t const &data_hash, uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count) override;

    Result<uint64_t> submit_batch_spending_report(
        Address const &sender, bytes32_t const &message_data_hash,
        evmc_tx_context const &) override;

    Result<uint64_t> enqueue_delayed_message(
        uint8_t kind, Address const &sender,
        bytes32_t const &message_data_hash, evmc_tx_context const &) override;

    uint64_t delayed_message_count() const override;
    uint64_t sequencer_message_count() const override;
    uint64_t total_delayed_messages_read() const override;
    uint256_t sequencer_reported_sub_message_count() const override;

    Result<bytes32_t> delayed_inbox_accs(uint64_t index) const override;
    Result<bytes32_t> sequencer_inbox_accs(uint64_t index) const override;

    Address rollup() const override;
};

INBOX_NAMESPACE_END
