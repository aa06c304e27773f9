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

#include <inbox/bridge/bridge.hpp>
#include <inbox/bridge/bridge_error.hpp>
#include <inbox/bridge/messages.hpp>
#include <inbox/contract/abi_encode.hpp>
#include <inbox/contract/abi_signatures.hpp>
#include <inbox/contract/events.hpp>
#include <inbox/contract/state.hpp>
#include <inbox/core/likely.h>

#include <intx/intx.hpp>

INBOX_NAMESPACE_BEGIN

Bridge::Bridge(State &state, Address const &address, Address const &rollup)
    : state_{state}
    , address_{address}
    , vars{state_, address_}
{
    if (vars.rollup.load() == Address{}) {
        vars.rollup.store(rollup);
    }
}

void Bridge::set_sequencer_inbox(Address const &inbox)
{
    vars.sequencer_inbox.store(inbox);
}

void Bridge::set_delayed_inbox(Address const &inbox)
{
    vars.delayed_inbox.store(inbox);
}

void Bridge::update_rollup_address(Address const &rollup)
{
    vars.rollup.store(rollup);
}

Result<SequencerMessageEnqueued> Bridge::enqueue_sequencer_message(
    bytes32_t const &data_hash, uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count)
{
    if (INBOX_UNLIKELY(
            vars.sequencer_reported_sub_message_count.load().native() !=
            prev_message_count)) {
        return BridgeError::BadSequencerMessageNumber;
    }
    if (INBOX_UNLIKELY(
            after_delayed_messages_read <
            vars.total_delayed_messages_read.load().native())) {
        return BridgeError::DelayedBackwards;
    }
    if (INBOX_UNLIKELY(
            after_delayed_messages_read >
            vars.delayed_inbox_accs.length())) {
        return BridgeError::DelayedTooFar;
    }

    SequencerMessageEnqueued res{};
    res.seq_message_index = vars.sequencer_inbox_accs.length();
    if (res.seq_message_index > 0) {
        res.before_acc =
            vars.sequencer_inbox_accs.get(res.seq_message_index - 1).load();
    }
    if (after_delayed_messages_read > 0) {
        res.delayed_acc =
            vars.delayed_inbox_accs.get(after_delayed_messages_read - 1)
                .load();
    }
    res.acc = accumulate_sequencer_message(
        res.before_acc, data_hash, res.delayed_acc);

    vars.sequencer_inbox_accs.push(res.acc);
    vars.total_delayed_messages_read.store(after_delayed_messages_read);
    vars.sequencer_reported_sub_message_count.store(new_message_count);
    return res;
}

Result<uint64_t> Bridge::submit_batch_spending_report(
    Address const &sender, bytes32_t const &message_data_hash,
    evmc_tx_context const &ctx)
{
    return enqueue_delayed(
        MessageKind::BatchPostingReport,
        sender,
        message_data_hash,
        vars.sequencer_inbox.load(),
        ctx);
}

Result<uint64_t> Bridge::enqueue_delayed_message(
    uint8_t const kind, Address const &sender,
    bytes32_t const &message_data_hash, evmc_tx_context const &ctx)
{
    return enqueue_delayed(
        kind, sender, message_data_hash, vars.delayed_inbox.load(), ctx);
}

uint64_t Bridge::enqueue_delayed(
    uint8_t const kind, Address const &sender,
    bytes32_t const &message_data_hash, Address const &inbox,
    evmc_tx_context const &ctx)
{
    uint64_t const count = vars.delayed_inbox_accs.length();
    bytes32_t const before_acc =
        count > 0 ? vars.delayed_inbox_accs.get(count - 1).load()
                  : bytes32_t{};

    DelayedMessage const msg{
        .kind = kind,
        .sender = sender,
        .block_number = static_cast<uint64_t>(ctx.block_number),
        .timestamp = static_cast<uint64_t>(ctx.block_timestamp),
        .inbox_seq_num = count,
        .base_fee_l1 = intx::be::load<uint256_t>(ctx.block_base_fee),
        .message_data_hash = message_data_hash};
    vars.delayed_inbox_accs.push(
        accumulate_message(before_acc, message_hash(msg)));

    emit_message_delivered(
        count,
        before_acc,
        inbox,
        kind,
        sender,
        message_data_hash,
        msg.base_fee_l1,
        msg.timestamp);
    return count;
}

uint64_t Bridge::delayed_message_count() const
{
    return vars.delayed_inbox_accs.length();
}

uint64_t Bridge::sequencer_message_count() const
{
    return vars.sequencer_inbox_accs.length();
}

uint64_t Bridge::total_delayed_messages_read() const
{
    return vars.total_delayed_messages_read.load().native();
}

uint256_t Bridge::sequencer_reported_sub_message_count() const
{
    return vars.sequencer_reported_sub_message_count.load().native();
}

Result<bytes32_t> Bridge::delayed_inbox_accs(uint64_t const index) const
{
    if (INBOX_UNLIKELY(index >= vars.delayed_inbox_accs.length())) {
        return BridgeError::IndexOutOfBounds;
    }
    return vars.delayed_inbox_accs.get(index).load();
}

Result<bytes32_t> Bridge::sequencer_inbox_accs(uint64_t const index) const
{
    if (INBOX_UNLIKELY(index >= vars.sequencer_inbox_accs.length())) {
        return BridgeError::IndexOutOfBounds;
    }
    return vars.sequencer_inbox_accs.get(index).load();
}

Address Bridge::rollup() const
{
    return vars.rollup.load();
}

void Bridge::emit_message_delivered(
    uint64_t const message_index, bytes32_t const &before_inbox_acc,
    Address const &inbox, uint8_t const kind, Address const &sender,
    bytes32_t const &message_data_hash, uint256_t const &base_fee_l1,
    uint64_t const timestamp)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "MessageDelivered(uint256,bytes32,address,uint8,address,bytes32,"
        "uint256,uint64)");
    static_assert(
        signature ==
        0x5e3c1311ea442664e8b1611bfabef659120ea7a0a2cfc0667700bebc69cbffe1_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(abi_encode_uint(u64_be{message_index}))
                           .add_topic(before_inbox_acc)
                           .add_data(abi_encode_address(inbox))
                           .add_data(abi_encode_uint(u8_be{kind}))
                           .add_data(abi_encode_address(sender))
                           .add_data(message_data_hash)
                           .add_data(abi_encode_uint(u256_be{base_fee_l1}))
                           .add_data(abi_encode_uint(u64_be{timestamp}))
                           .build();
    state_.store_log(event);
}

INBOX_NAMESPACE_END
