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
#include <inbox/contract/abi_signatures.hpp>
#include <inbox/contract/state.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/keccak.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace inbox;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto BRIDGE{0x00000000000000000000000000000000000b51d6_address};
    constexpr auto DATA_HASH{
        0x00000000000000000000000000000000000000000000000000000000000000d5_bytes32};
    constexpr auto ROLLUP{0x0000000000000000000000000000000000001001_address};
    constexpr auto DELAYED_INBOX{
        0x0000000000000000000000000000000000001002_address};
    constexpr auto SEQUENCER_INBOX{
        0x0000000000000000000000000000000000001003_address};
    constexpr auto DATA_HASH{
        0x1111111111111111111111111111111111111111111111111111111111111111_bytes32};
}

struct BridgeTest : public ::testing::Test
{
    State state;
    Bridge bridge{state, BRIDGE, ROLLUP};
    evmc_tx_context ctx{};

    void SetUp() override
    {
        bridge.set_delayed_inbox(DELAYED_INBOX);
        bridge.set_sequencer_inbox(SEQUENCER_INBOX);
        ctx.block_number = 100;
        ctx.block_timestamp = 1000;
        ctx.block_base_fee = intx::be::store<evmc::uint256be>(7_u256);
    }
};

TEST(Messages, message_hash)
{
    DelayedMessage const msg{
        .kind = MessageKind::BatchPostingReport,
        .sender = Address{0xdeadbeef},
        .block_number = 100,
        .timestamp = 1000,
        .inbox_seq_num = 0,
        .base_fee_l1 = 7,
        .message_data_hash = DATA_HASH};
    EXPECT_EQ(
        message_hash(msg),
        0x72f6b3ad7d98be6bd193621783ebfc4a3bdef6a58ea228f7acf77eb41de70678_bytes32);
    EXPECT_EQ(
        accumulate_message(bytes32_t{}, message_hash(msg)),
        0xe722a8992600aaa9377cfabccb18eecdd3b9784b56cacdd21dac56fb6f628600_bytes32);

    auto mutated = msg;
    mutated.timestamp = 1001;
    EXPECT_NE(message_hash(mutated), message_hash(msg));
}

TEST_F(BridgeTest, delayed_messages_chain)
{
    EXPECT_EQ(bridge.delayed_message_count(), 0);

    auto const first = bridge.enqueue_delayed_message(
        MessageKind::BatchPostingReport, Address{0xdeadbeef}, DATA_HASH, ctx);
    ASSERT_FALSE(first.has_error());
    EXPECT_EQ(first.value(), 0);
    EXPECT_EQ(
        bridge.delayed_inbox_accs(0).value(),
        0xe722a8992600aaa9377cfabccb18eecdd3b9784b56cacdd21dac56fb6f628600_bytes32);

    ctx.block_number = 101;
    auto const second = bridge.enqueue_delayed_message(
        MessageKind::L2Message, Address{0xabcd}, DATA_HASH, ctx);
    ASSERT_FALSE(second.has_error());
    EXPECT_EQ(second.value(), 1);
    EXPECT_EQ(bridge.delayed_message_count(), 2);

    DelayedMessage const msg{
        .kind = MessageKind::L2Message,
        .sender = Address{0xabcd},
        .block_number = 101,
        .timestamp = 1000,
        .inbox_seq_num = 1,
        .base_fee_l1 = 7,
        .message_data_hash = DATA_HASH};
    EXPECT_EQ(
        bridge.delayed_inbox_accs(1).value(),
        accumulate_message(
            bridge.delayed_inbox_accs(0).value(), message_hash(msg)));

    EXPECT_EQ(
        bridge.delayed_inbox_accs(2).assume_error(),
        BridgeError::IndexOutOfBounds);
}

TEST_F(BridgeTest, message_delivered_event)
{
    ASSERT_FALSE(bridge
                     .submit_batch_spending_report(
                         Address{0xdeadbeef}, DATA_HASH, ctx)
                     .has_error());
    ASSERT_EQ(state.logs().size(), 1);

    auto const &log = state.logs()[0];
    EXPECT_EQ(log.address, BRIDGE);
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(
        log.topics[0],
        abi_encode_event_signature(
            "MessageDelivered(uint256,bytes32,address,uint8,address,bytes32,"
            "uint256,uint64)"));
    EXPECT_EQ(log.topics[1], bytes32_t{});
    EXPECT_EQ(log.topics[2], bytes32_t{});
    ASSERT_EQ(log.data.size(), 6 * 32);
    // the spending report names the sequencer inbox and its kind
    EXPECT_EQ(log.data[31], SEQUENCER_INBOX.bytes[19]);
    EXPECT_EQ(log.data[63], MessageKind::BatchPostingReport);
}

TEST_F(BridgeTest, sequencer_messages_chain)
{
    for (int i = 0; i < 3; ++i) {
        ASSERT_FALSE(bridge
                         .enqueue_delayed_message(
                             MessageKind::L2Message, Address{0xabcd},
                             DATA_HASH, ctx)
                         .has_error());
    }

    auto const first =
        bridge.enqueue_sequencer_message(DATA_HASH, 2, 0, 10);
    ASSERT_FALSE(first.has_error());
    EXPECT_EQ(first.value().seq_message_index, 0);
    EXPECT_EQ(first.value().before_acc, bytes32_t{});
    EXPECT_EQ(first.value().delayed_acc, bridge.delayed_inbox_accs(1).value());
    EXPECT_EQ(
        first.value().acc,
        accumulate_sequencer_message(
            bytes32_t{}, DATA_HASH, first.value().delayed_acc));
    EXPECT_EQ(bridge.total_delayed_messages_read(), 2);
    EXPECT_EQ(bridge.sequencer_reported_sub_message_count(), 10);

    auto const second =
        bridge.enqueue_sequencer_message(DATA_HASH, 3, 10, 12);
    ASSERT_FALSE(second.has_error());
    EXPECT_EQ(second.value().seq_message_index, 1);
    EXPECT_EQ(second.value().before_acc, first.value().acc);
    EXPECT_EQ(bridge.sequencer_inbox_accs(1).value(), second.value().acc);
    EXPECT_EQ(bridge.sequencer_message_count(), 2);
}

TEST_F(BridgeTest, sequencer_message_validation)
{
    ASSERT_FALSE(bridge
                     .enqueue_delayed_message(
                         MessageKind::L2Message, Address{0xabcd}, DATA_HASH,
                         ctx)
                     .has_error());

    EXPECT_EQ(
        bridge.enqueue_sequencer_message(DATA_HASH, 0, 5, 10).assume_error(),
        BridgeError::BadSequencerMessageNumber);
    EXPECT_EQ(
        bridge.enqueue_sequencer_message(DATA_HASH, 2, 0, 10).assume_error(),
        BridgeError::DelayedTooFar);

    ASSERT_FALSE(
        bridge.enqueue_sequencer_message(DATA_HASH, 1, 0, 10).has_error());
    EXPECT_EQ(
        bridge.enqueue_sequencer_message(DATA_HASH, 0, 10, 20).assume_error(),
        BridgeError::DelayedBackwards);
}

TEST_F(BridgeTest, rollup_address)
{
    EXPECT_EQ(bridge.rollup(), ROLLUP);
    bridge.update_rollup_address(DELAYED_INBOX);
    EXPECT_EQ(bridge.rollup(), DELAYED_INBOX);
}
