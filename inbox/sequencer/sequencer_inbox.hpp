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

#include <inbox/bridge/bridge.hpp>
#include <inbox/contract/big_endian.hpp>
#include <inbox/contract/storage_variable.hpp>
#include <inbox/core/address.hpp>
#include <inbox/core/byte_string.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>
#include <inbox/core/int.hpp>
#include <inbox/core/result.hpp>
#include <inbox/sequencer/batch_header.hpp>
#include <inbox/sequencer/delay_buffer.hpp>
#include <inbox/sequencer/delay_proof.hpp>
#include <inbox/sequencer/inbox_config.hpp>

#include <evmc/evmc.h>

#include <cstdint>
#include <optional>

INBOX_NAMESPACE_BEGIN

class IRollupOwner;
class State;

// Orders sequencer batches against the delayed message queue of an IBridge.
//
// Every mutating call is atomic: it runs in its own State checkpoint and
// either commits all of its writes and logs or none of them.
class SequencerInbox
{
public:
    struct MaxTimeVariation
    {
        u64_be delay_blocks;
        u64_be future_blocks;
        u64_be delay_seconds;
        u64_be future_seconds;
    };

    static_assert(sizeof(MaxTimeVariation) == 32);
    static_assert(alignof(MaxTimeVariation) == 1);

    struct BufferData
    {
        u64_be buffer_blocks;
        u64_be buffer_seconds;
        u64_be prev_block_number;
        u64_be prev_timestamp;
        u64_be prev_sequenced_block_number;
        u64_be prev_sequenced_timestamp;
    };

    static_assert(sizeof(BufferData) == 48);
    static_assert(alignof(BufferData) == 1);

    struct SyncExpiry
    {
        u64_be block_number;
        u64_be timestamp;
    };

    static_assert(sizeof(SyncExpiry) == 16);
    static_assert(alignof(SyncExpiry) == 1);

    struct KeysetInfo
    {
        bool is_valid_keyset;
        u64_be creation_block;
    };

    static_assert(sizeof(KeysetInfo) == 9);
    static_assert(alignof(KeysetInfo) == 1);

private:
    State &state_;
    IBridge &bridge_;
    IRollupOwner const &rollup_owner_;
    Address const address_;
    InboxConfig const config_;

public:
    class Variables
    {
        State &state_;
        Address const &address_;

        static constexpr auto AddressInitialized{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
        static constexpr auto AddressDeploymentChainId{
            0x0000000000000000000000000000000000000000000000000000000000000002_bytes32};
        static constexpr auto AddressMaxTimeVariation{
            0x0000000000000000000000000000000000000000000000000000000000000003_bytes32};
        static constexpr auto AddressRollup{
            0x0000000000000000000000000000000000000000000000000000000000000004_bytes32};
        static constexpr auto AddressBatchPosterManager{
            0x0000000000000000000000000000000000000000000000000000000000000005_bytes32};
        // two slots
        static constexpr auto AddressBuffer{
            0x0000000000000000000000000000000000000000000000000000000000000010_bytes32};

        enum Namespace : uint8_t
        {
            NSBatchPoster = 0x01,
            NSSequencer = 0x02,
            NSSyncCache = 0x03,
            NSKeyset = 0x04,
        };

        StorageVariable<bool>
        address_flag(Namespace const ns, Address const &address) const
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = ns, .address = address, .slots = {}};

            return {state_, address_, std::bit_cast<bytes32_t>(key)};
        }

    public:
        Variables(State &state, Address const &address)
            : state_{state}
            , address_{address}
        {
        }

        StorageVariable<bool> initialized{
            state_, address_, AddressInitialized};

        // chain id seen at initialize; a different id forces strict bounds
        StorageVariable<u256_be> deployment_chain_id{
            state_, address_, AddressDeploymentChainId};

        StorageVariable<MaxTimeVariation> max_time_variation{
            state_, address_, AddressMaxTimeVariation};

        StorageVariable<Address> rollup{state_, address_, AddressRollup};

        StorageVariable<Address> batch_poster_manager{
            state_, address_, AddressBatchPosterManager};

        StorageVariable<BufferData> buffer{state_, address_, AddressBuffer};

        // mapping(address => bool) isBatchPoster
        StorageVariable<bool> is_batch_poster(Address const &address) const
        {
            return address_flag(NSBatchPoster, address);
        }

        // mapping(address => bool) isSequencer
        StorageVariable<bool> is_sequencer(Address const &address) const
        {
            return address_flag(NSSequencer, address);
        }

        // mapping(address => SyncExpiry) syncCache
        //
        // Per batch poster. Set after a proof leaves the buffer full.
        StorageVariable<SyncExpiry> sync_cache(Address const &address) const
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = NSSyncCache, .address = address, .slots = {}};

            return {state_, address_, std::bit_cast<bytes32_t>(key)};
        }

        // mapping(bytes32 => KeysetInfo) dasKeySetInfo
        //
        // The slot is the hash of the keyset hash, kept under the namespace
        // byte.
        StorageVariable<KeysetInfo> keyset_info(bytes32_t const &hash) const;
    } vars;

    SequencerInbox(
        State &, IBridge &, IRollupOwner const &, Address const &address,
        InboxConfig const &);

    Address const &address() const noexcept
    {
        return address_;
    }

    InboxConfig const &config() const noexcept
    {
        return config_;
    }

    // Validates the configuration, records the host chain id and fills the
    // delay buffer. Callable once.
    Result<void> initialize(evmc_tx_context const &);

    ////////////////////////
    // Batch submission   //
    ////////////////////////

    // Inline data posted by the transaction origin. Emits a batch spending
    // report for non-empty data on native fee chains.
    Result<void> add_sequencer_l2_batch_from_origin(
        Address const &sender, uint256_t const &sequence_number,
        byte_string_view data, uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count, evmc_tx_context const &);

    // Inline data posted by a batch poster contract or the rollup. The data
    // is carried in a SequencerBatchData event.
    Result<void> add_sequencer_l2_batch(
        Address const &sender, uint256_t const &sequence_number,
        byte_string_view data, uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count, evmc_tx_context const &);

    // Data in the transaction's blobs.
    Result<void> add_sequencer_l2_batch_from_blobs(
        Address const &sender, uint256_t const &sequence_number,
        uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count, evmc_tx_context const &);

    Result<void> add_sequencer_l2_batch_from_origin_delay_proof(
        Address const &sender, uint256_t const &sequence_number,
        byte_string_view data, uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count, DelayProof const &,
        evmc_tx_context const &);

    Result<void> add_sequencer_l2_batch_from_blobs_delay_proof(
        Address const &sender, uint256_t const &sequence_number,
        uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count, DelayProof const &,
        evmc_tx_context const &);

    // The first message of the proof is checked before the batch is
    // enqueued, the last one against the delayed accumulator the ledger
    // binds into the batch.
    Result<void> add_sequencer_l2_batch_from_origin_resync_proof(
        Address const &sender, uint256_t const &sequence_number,
        byte_string_view data, uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count, ResyncProof const &,
        evmc_tx_context const &);

    // Pre sub-message-count entry point. Always fails.
    Result<void> add_sequencer_l2_batch_from_origin_legacy(
        Address const &sender, uint256_t const &sequence_number,
        byte_string_view data, uint64_t after_delayed_messages_read,
        evmc_tx_context const &);

    // Permissionless. Reads every delayed message up to and including
    // total_delayed_messages_read - 1 once that message is past the delay
    // window.
    Result<void> force_inclusion(
        uint64_t total_delayed_messages_read, uint8_t kind,
        uint64_t block_number, uint64_t timestamp,
        uint256_t const &base_fee_l1, Address const &sender,
        bytes32_t const &message_data_hash, evmc_tx_context const &);

    ////////////////////////
    // Admin              //
    ////////////////////////

    Result<void> set_max_time_variation(
        Address const &sender, TimeVariation const &);

    Result<void> set_is_batch_poster(
        Address const &sender, Address const &addr, bool is_batch_poster);

    Result<void> set_is_sequencer(
        Address const &sender, Address const &addr, bool is_sequencer);

    Result<void>
    set_batch_poster_manager(Address const &sender, Address const &manager);

    Result<void> set_valid_keyset(
        Address const &sender, byte_string_view keyset_bytes,
        evmc_tx_context const &);

    Result<void>
    invalidate_keyset_hash(Address const &sender, bytes32_t const &hash);

    // Picks up the rollup address currently recorded by the bridge.
    Result<void> update_rollup_address(Address const &sender);

    ////////////////////////
    // Queries            //
    ////////////////////////

    // Bounds applied to a caller without a valid sync cache.
    TimeVariation max_time_variation(evmc_tx_context const &) const;

    TimeVariation
    max_time_variation_for(Address const &, evmc_tx_context const &) const;

    bool is_delay_bufferable() const;

    // Whether a batch by `sender` reading up to after_delayed_messages_read
    // must carry a delay proof.
    bool is_delay_proof_required(
        Address const &sender, uint64_t after_delayed_messages_read,
        evmc_tx_context const &) const;

    uint64_t batch_count() const;
    Result<bytes32_t> inbox_accs(uint64_t index) const;
    uint64_t total_delayed_messages_read() const;

    bool is_valid_keyset_hash(bytes32_t const &) const;
    Result<uint64_t> get_keyset_creation_block(bytes32_t const &) const;

    bool is_batch_poster(Address const &) const;
    bool is_sequencer(Address const &) const;

    DelayBufferState buffer() const;
    SyncCache sync_cache(Address const &) const;

    Address rollup() const;
    Address batch_poster_manager() const;

private:
    struct FormedBatch
    {
        bytes32_t data_hash;
        TimeBounds bounds;
    };

    template <typename F>
    Result<void> execute(F &&);

    Result<void> only_rollup_owner(Address const &sender) const;
    Result<void>
    only_rollup_owner_or_batch_poster_manager(Address const &sender) const;
    Result<void> only_batch_poster(
        Address const &sender, evmc_tx_context const &,
        bool require_origin) const;

    bool chain_id_changed(evmc_tx_context const &) const;
    TimeVariation strict_time_variation() const;
    TimeVariation effective_time_variation(
        std::optional<Address> const &caller, evmc_tx_context const &) const;

    void store_buffer(DelayBufferState const &);
    void update_buffers(
        uint64_t msg_block_number, uint64_t msg_timestamp,
        evmc_tx_context const &);
    void refresh_sync_cache(
        Address const &caller, DelayedMessage const &anchor);

    Result<void> delay_proof_impl(
        Address const &sender, uint64_t after_delayed_messages_read,
        DelayProof const &, evmc_tx_context const &);

    Result<FormedBatch> form_calldata_hash(
        byte_string_view data, uint64_t after_delayed_messages_read,
        TimeVariation const &, evmc_tx_context const &) const;

    Result<SequencerMessageEnqueued> add_sequencer_l2_batch_impl(
        bytes32_t const &data_hash, uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count,
        uint256_t const &sequence_number);

    Result<SequencerMessageEnqueued> add_calldata_batch(
        Address const &sender, uint256_t const &sequence_number,
        byte_string_view data, uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count, BatchDataLocation,
        evmc_tx_context const &);

    Result<void> add_blob_batch(
        Address const &sender, uint256_t const &sequence_number,
        uint64_t after_delayed_messages_read,
        uint256_t const &prev_message_count,
        uint256_t const &new_message_count, evmc_tx_context const &);

    Result<void> submit_batch_spending_report(
        bytes32_t const &data_hash, uint64_t seq_message_index,
        uint256_t const &extra_gas, evmc_tx_context const &);

    /////////////
    // Events //
    /////////////

    // event SequencerBatchDelivered(
    //     uint256 indexed batchSequenceNumber,
    //     bytes32 indexed beforeAcc,
    //     bytes32 indexed afterAcc,
    //     bytes32         delayedAcc,
    //     uint256         afterDelayedMessagesRead,
    //     (uint64,uint64,uint64,uint64) timeBounds,
    //     uint8           dataLocation);
    void emit_sequencer_batch_delivered(
        SequencerMessageEnqueued const &,
        uint64_t after_delayed_messages_read, TimeBounds const &,
        BatchDataLocation);

    // event SequencerBatchData(uint256 indexed batchSequenceNumber, bytes data)
    void emit_sequencer_batch_data(
        uint64_t seq_message_index, byte_string_view data);

    // event InboxMessageDelivered(uint256 indexed messageNum, bytes data)
    void
    emit_inbox_message_delivered(uint64_t message_num, byte_string_view data);

    // event OwnerFunctionCalled(uint256 indexed id)
    void emit_owner_function_called(uint64_t id);

    // event SetValidKeyset(bytes32 indexed keysetHash, bytes keysetBytes)
    void emit_set_valid_keyset(bytes32_t const &, byte_string_view);

    // event InvalidateKeyset(bytes32 indexed keysetHash)
    void emit_invalidate_keyset(bytes32_t const &);

    // event BatchPosterSet(address indexed batchPoster, bool isBatchPoster)
    void emit_batch_poster_set(Address const &, bool);

    // event SequencerSet(address indexed addr, bool isSequencer)
    void emit_sequencer_set(Address const &, bool);

    // event BatchPosterManagerSet(address indexed newBatchPosterManager)
    void emit_batch_poster_manager_set(Address const &);
};

INBOX_NAMESPACE_END
