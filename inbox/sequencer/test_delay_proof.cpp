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
#include <inbox/contract/state.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/sequencer/delay_proof.hpp>
#include <inbox/sequencer/sequencer_error.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace inbox;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr auto BRIDGE{0x00000000000000000000000000000000000b51d6_address};
    constexpr auto ROLLUP{0x0000000000000000000000000000000000001001_address};
    constexpr auto SENDER{0x00000000000000000000000000000000deadbeef_address};
}

struct DelayProofTest : public ::testing::Test
{
    State state;
    Bridge bridge{state, BRIDGE, ROLLUP};
    evmc_tx_context ctx{};
    DelayProof proof{};

    void SetUp() override
    {
        ctx.block_number = 100;
        ctx.block_timestamp = 1000;
        ctx.block_base_fee = intx::be::store<evmc::uint256be>(7_u256);

        for (uint8_t i = 0; i < 3; ++i) {
            bytes32_t data_hash{};
            data_hash.bytes[31] = i;
            ASSERT_FALSE(bridge
                             .enqueue_delayed_message(
                                 MessageKind::L2Message, SENDER, data_hash, ctx)
                             .has_error());
            ctx.block_number += 1;
            ctx.block_timestamp += 12;
        }

        // preimage of the second message
        proof.before_delayed_acc = bridge.delayed_inbox_accs(0).value();
        proof.delayed_message = DelayedMessage{
            .kind = MessageKind::L2Message,
            .sender = SENDER,
            .block_number = 101,
            .timestamp = 1012,
            .inbox_seq_num = 1,
            .base_fee_l1 = 7,
            .message_data_hash = bytes32_t{1}};
    }
};

TEST_F(DelayProofTest, valid)
{
    EXPECT_TRUE(is_valid_preimage(proof, bridge.delayed_inbox_accs(1).value()));
    EXPECT_FALSE(verify_delay_proof(bridge, 1, proof).has_error());
}

TEST_F(DelayProofTest, wrong_index)
{
    auto const res = verify_delay_proof(bridge, 2, proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), SequencerInboxError::InvalidDelayedAccPreimage);

    auto const oob = verify_delay_proof(bridge, 3, proof);
    ASSERT_TRUE(oob.has_error());
    EXPECT_EQ(oob.assume_error(), BridgeError::IndexOutOfBounds);
}

TEST_F(DelayProofTest, any_field_change_is_rejected)
{
    auto const target = bridge.delayed_inbox_accs(1).value();

    auto check = [&](DelayProof const &mutated) {
        auto const res = verify_delay_proof(target, mutated);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(
            res.assume_error(), SequencerInboxError::InvalidDelayedAccPreimage);
    };

    for (size_t i = 0; i < sizeof(bytes32_t); ++i) {
        auto mutated = proof;
        mutated.before_delayed_acc.bytes[i] ^= 0x01;
        check(mutated);
    }
    for (size_t i = 0; i < sizeof(bytes32_t); ++i) {
        auto mutated = proof;
        mutated.delayed_message.message_data_hash.bytes[i] ^= 0x80;
        check(mutated);
    }

    auto mutated = proof;
    mutated.delayed_message.kind = MessageKind::EthDeposit;
    check(mutated);

    mutated = proof;
    mutated.delayed_message.sender.bytes[0] ^= 0x01;
    check(mutated);

    mutated = proof;
    mutated.delayed_message.block_number += 1;
    check(mutated);

    mutated = proof;
    mutated.delayed_message.timestamp -= 1;
    check(mutated);

    mutated = proof;
    mutated.delayed_message.inbox_seq_num = 2;
    check(mutated);

    mutated = proof;
    mutated.delayed_message.base_fee_l1 = 8;
    check(mutated);
}
