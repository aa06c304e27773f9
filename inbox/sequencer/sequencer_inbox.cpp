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
#include <inbox/bridge/messages.hpp>
#include <inbox/contract/abi_encode.hpp>
#include <inbox/contract/abi_signatures.hpp>
#include <inbox/contract/big_endian.hpp>
#include <inbox/contract/events.hpp>
#include <inbox/contract/state.hpp>
#include <inbox/core/byte_string.hpp>
#include <inbox/core/fmt/hex_fmt.hpp>
#include <inbox/core/fmt/int_fmt.hpp>
#include <inbox/core/keccak.hpp>
#include <inbox/core/likely.h>
#include <inbox/core/math.hpp>
#include <inbox/sequencer/batch_header.hpp>
#include <inbox/sequencer/delay_buffer.hpp>
#include <inbox/sequencer/delay_proof.hpp>
#include <inbox/sequencer/rollup_owner.hpp>
#include <inbox/sequencer/sequencer_error.hpp>
#include <inbox/sequencer/sequencer_inbox.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <bit>
#include <limits>
#include <span>
#include <vector>

INBOX_ANONYMOUS_NAMESPACE_BEGIN

// ids carried by OwnerFunctionCalled
enum OwnerFunction : uint64_t
{
    SetMaxTimeVariation = 0,
    SetIsBatchPoster = 1,
    SetValidKeyset = 2,
    InvalidateKeysetHash = 3,
    SetIsSequencer = 4,
    SetBatchPosterManager = 5,
    UpdateRollupAddress = 6,
};

uint64_t block_number(evmc_tx_context const &ctx)
{
    return static_cast<uint64_t>(ctx.block_number);
}

uint64_t block_timestamp(evmc_tx_context const &ctx)
{
    return static_cast<uint64_t>(ctx.block_timestamp);
}

uint256_t base_fee(evmc_tx_context const &ctx)
{
    return intx::be::load<uint256_t>(ctx.block_base_fee);
}

std::span<bytes32_t const> blob_hashes(evmc_tx_context const &ctx)
{
    if (ctx.blob_hashes_count == 0) {
        return {};
    }
    static_assert(sizeof(bytes32_t) == sizeof(evmc_bytes32));
    return {
        static_cast<bytes32_t const *>(ctx.blob_hashes), ctx.blob_hashes_count};
}

TimeVariation from_storage(SequencerInbox::MaxTimeVariation const &v)
{
    return TimeVariation{
        .delay_blocks = v.delay_blocks.native(),
        .future_blocks = v.future_blocks.native(),
        .delay_seconds = v.delay_seconds.native(),
        .future_seconds = v.future_seconds.native()};
}

DelayBufferState from_storage(SequencerInbox::BufferData const &b)
{
    return DelayBufferState{
        .buffer_blocks = b.buffer_blocks.native(),
        .buffer_seconds = b.buffer_seconds.native(),
        .prev_block_number = b.prev_block_number.native(),
        .prev_timestamp = b.prev_timestamp.native(),
        .prev_sequenced_block_number = b.prev_sequenced_block_number.native(),
        .prev_sequenced_timestamp = b.prev_sequenced_timestamp.native()};
}

INBOX_ANONYMOUS_NAMESPACE_END

INBOX_NAMESPACE_BEGIN

StorageVariable<SequencerInbox::KeysetInfo>
SequencerInbox::Variables::keyset_info(bytes32_t const &hash) const
{
    struct
    {
        uint8_t ns;
        bytes32_t hash;
    } const preimage{.ns = NSKeyset, .hash = hash};

    auto const packed =
        std::bit_cast<byte_string_fixed<sizeof(preimage)>>(preimage);
    bytes32_t key = to_bytes(keccak256(to_byte_string_view(packed)));
    key.bytes[0] = NSKeyset;
    return {state_, address_, key};
}

SequencerInbox::SequencerInbox(
    State &state, IBridge &bridge, IRollupOwner const &rollup_owner,
    Address const &address, InboxConfig const &config)
    : state_{state}
    , bridge_{bridge}
    , rollup_owner_{rollup_owner}
    , address_{address}
    , config_{config}
    , vars{state_, address_}
{
}

template <typename F>
Result<void> SequencerInbox::execute(F &&f)
{
    state_.push();
    Result<void> res = [&]() -> Result<void> {
        if (INBOX_UNLIKELY(!vars.initialized.load())) {
            return SequencerInboxError::NotInitialized;
        }
        return f();
    }();
    if (res.has_error()) {
        state_.pop_reject();
    }
    else {
        state_.pop_accept();
    }
    return res;
}

Result<void> SequencerInbox::initialize(evmc_tx_context const &ctx)
{
    if (INBOX_UNLIKELY(vars.initialized.load())) {
        return SequencerInboxError::AlreadyInit;
    }
    BOOST_OUTCOME_TRY(validate_inbox_config(config_));

    state_.push();
    vars.initialized.store(true);
    vars.deployment_chain_id.store(intx::be::load<uint256_t>(ctx.chain_id));
    auto const &tv = config_.max_time_variation;
    vars.max_time_variation.store(MaxTimeVariation{
        .delay_blocks = tv.delay_blocks,
        .future_blocks = tv.future_blocks,
        .delay_seconds = tv.delay_seconds,
        .future_seconds = tv.future_seconds});
    vars.rollup.store(bridge_.rollup());
    if (is_delay_bufferable()) {
        store_buffer(full_buffer(config_.buffer_config));
    }
    state_.pop_accept();

    LOG_INFO(
        "SequencerInbox {} initialized: rollup {}, bufferable {}",
        address_,
        vars.rollup.load(),
        is_delay_bufferable());
    return outcome::success();
}

////////////////////////
// Authorization      //
////////////////////////

Result<void> SequencerInbox::only_rollup_owner(Address const &sender) const
{
    if (INBOX_UNLIKELY(sender != rollup_owner_.owner(vars.rollup.load()))) {
        return SequencerInboxError::NotOwner;
    }
    return outcome::success();
}

Result<void> SequencerInbox::only_rollup_owner_or_batch_poster_manager(
    Address const &sender) const
{
    if (sender != rollup_owner_.owner(vars.rollup.load()) &&
        INBOX_UNLIKELY(sender != vars.batch_poster_manager.load())) {
        return SequencerInboxError::NotBatchPosterManager;
    }
    return outcome::success();
}

Result<void> SequencerInbox::only_batch_poster(
    Address const &sender, evmc_tx_context const &ctx,
    bool const require_origin) const
{
    if (require_origin &&
        INBOX_UNLIKELY(sender != Address{ctx.tx_origin})) {
        return SequencerInboxError::NotOrigin;
    }
    if (INBOX_UNLIKELY(!vars.is_batch_poster(sender).load())) {
        return SequencerInboxError::NotBatchPoster;
    }
    return outcome::success();
}

////////////////////////
// Delay buffer       //
////////////////////////

bool SequencerInbox::chain_id_changed(evmc_tx_context const &ctx) const
{
    return intx::be::load<uint256_t>(ctx.chain_id) !=
           vars.deployment_chain_id.load().native();
}

TimeVariation SequencerInbox::strict_time_variation() const
{
    return from_storage(vars.max_time_variation.load());
}

TimeVariation SequencerInbox::effective_time_variation(
    std::optional<Address> const &caller, evmc_tx_context const &ctx) const
{
    if (chain_id_changed(ctx)) {
        return TimeVariation{
            .delay_blocks = 1,
            .future_blocks = 1,
            .delay_seconds = 1,
            .future_seconds = 1};
    }
    TimeVariation const strict = strict_time_variation();
    if (!is_delay_bufferable()) {
        return strict;
    }
    DelayBufferState const state = buffer();
    bool const synced =
        caller.has_value() &&
        is_synced(
            sync_cache(*caller),
            state,
            config_.buffer_config,
            block_number(ctx),
            block_timestamp(ctx));
    return buffered_time_variation(
        strict, state, config_.buffer_config, synced);
}

void SequencerInbox::store_buffer(DelayBufferState const &state)
{
    vars.buffer.store(BufferData{
        .buffer_blocks = state.buffer_blocks,
        .buffer_seconds = state.buffer_seconds,
        .prev_block_number = state.prev_block_number,
        .prev_timestamp = state.prev_timestamp,
        .prev_sequenced_block_number = state.prev_sequenced_block_number,
        .prev_sequenced_timestamp = state.prev_sequenced_timestamp});
}

void SequencerInbox::update_buffers(
    uint64_t const msg_block_number, uint64_t const msg_timestamp,
    evmc_tx_context const &ctx)
{
    DelayBufferState const prev = buffer();
    DelayBufferState const next = update_buffer(
        prev,
        config_.buffer_config,
        config_.replenish_rate,
        msg_block_number,
        msg_timestamp,
        block_number(ctx),
        block_timestamp(ctx));
    if (next.buffer_blocks < prev.buffer_blocks ||
        next.buffer_seconds < prev.buffer_seconds) {
        LOG_WARNING(
            "SequencerInbox: delay buffer depleted to {} blocks, {} seconds",
            next.buffer_blocks,
            next.buffer_seconds);
    }
    store_buffer(next);
}

void SequencerInbox::refresh_sync_cache(
    Address const &caller, DelayedMessage const &anchor)
{
    if (!is_full(buffer(), config_.buffer_config)) {
        return;
    }
    SyncCache const cache = make_sync_cache(
        config_.buffer_config, anchor.block_number, anchor.timestamp);
    vars.sync_cache(caller).store(SyncExpiry{
        .block_number = cache.expiry_block_number,
        .timestamp = cache.expiry_timestamp});
}

Result<void> SequencerInbox::delay_proof_impl(
    Address const &sender, uint64_t const after_delayed_messages_read,
    DelayProof const &proof, evmc_tx_context const &ctx)
{
    if (INBOX_UNLIKELY(!is_delay_bufferable())) {
        return SequencerInboxError::NotDelayBufferable;
    }
    uint64_t const read = bridge_.total_delayed_messages_read();
    if (INBOX_UNLIKELY(after_delayed_messages_read <= read)) {
        return SequencerInboxError::NotDelayedFarEnough;
    }
    if (INBOX_UNLIKELY(read >= bridge_.delayed_message_count())) {
        return SequencerInboxError::DelayedTooFar;
    }
    BOOST_OUTCOME_TRY(verify_delay_proof(bridge_, read, proof));

    auto const &msg = proof.delayed_message;
    update_buffers(msg.block_number, msg.timestamp, ctx);
    refresh_sync_cache(sender, msg);
    return outcome::success();
}

////////////////////////
// Batch submission   //
////////////////////////

Result<SequencerInbox::FormedBatch> SequencerInbox::form_calldata_hash(
    byte_string_view const data, uint64_t const after_delayed_messages_read,
    TimeVariation const &variation, evmc_tx_context const &ctx) const
{
    BOOST_OUTCOME_TRY(validate_calldata(data, config_.max_data_size));
    if (auto const hash = embedded_keyset_hash(data); hash.has_value()) {
        if (INBOX_UNLIKELY(!is_valid_keyset_hash(*hash))) {
            return SequencerInboxError::NoSuchKeyset;
        }
    }
    TimeBounds const bounds =
        time_bounds(variation, block_number(ctx), block_timestamp(ctx));
    BatchHeader const header =
        encode_header(bounds, after_delayed_messages_read);
    return FormedBatch{
        .data_hash = data.empty() ? empty_hash(header)
                                  : calldata_hash(header, data),
        .bounds = bounds};
}

Result<SequencerMessageEnqueued> SequencerInbox::add_sequencer_l2_batch_impl(
    bytes32_t const &data_hash, uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    uint256_t const &sequence_number)
{
    if (INBOX_UNLIKELY(
            after_delayed_messages_read <
            bridge_.total_delayed_messages_read())) {
        return SequencerInboxError::DelayedBackwards;
    }
    if (INBOX_UNLIKELY(
            after_delayed_messages_read > bridge_.delayed_message_count())) {
        return SequencerInboxError::DelayedTooFar;
    }
    if (INBOX_UNLIKELY(
            sequence_number != UINT256_MAX &&
            sequence_number != bridge_.sequencer_message_count())) {
        return SequencerInboxError::BadSequencerNumber;
    }
    return bridge_.enqueue_sequencer_message(
        data_hash,
        after_delayed_messages_read,
        prev_message_count,
        new_message_count);
}

Result<SequencerMessageEnqueued> SequencerInbox::add_calldata_batch(
    Address const &sender, uint256_t const &sequence_number,
    byte_string_view const data, uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    BatchDataLocation const location, evmc_tx_context const &ctx)
{
    BOOST_OUTCOME_TRY(
        auto const batch,
        form_calldata_hash(
            data,
            after_delayed_messages_read,
            effective_time_variation(sender, ctx),
            ctx));
    BOOST_OUTCOME_TRY(
        auto const enqueued,
        add_sequencer_l2_batch_impl(
            batch.data_hash,
            after_delayed_messages_read,
            prev_message_count,
            new_message_count,
            sequence_number));

    if (location == BatchDataLocation::TxInput && !data.empty() &&
        !config_.is_using_fee_token) {
        BOOST_OUTCOME_TRY(submit_batch_spending_report(
            batch.data_hash, enqueued.seq_message_index, 0, ctx));
    }

    emit_sequencer_batch_delivered(
        enqueued, after_delayed_messages_read, batch.bounds, location);
    if (location == BatchDataLocation::SeparateBatchEvent) {
        emit_sequencer_batch_data(enqueued.seq_message_index, data);
    }
    return enqueued;
}

Result<void> SequencerInbox::add_blob_batch(
    Address const &sender, uint256_t const &sequence_number,
    uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    evmc_tx_context const &ctx)
{
    auto const hashes = blob_hashes(ctx);
    if (INBOX_UNLIKELY(hashes.empty())) {
        return SequencerInboxError::MissingDataHashes;
    }
    TimeBounds const bounds = time_bounds(
        effective_time_variation(sender, ctx),
        block_number(ctx),
        block_timestamp(ctx));
    bytes32_t const data_hash =
        blob_hash(encode_header(bounds, after_delayed_messages_read), hashes);

    BOOST_OUTCOME_TRY(
        auto const enqueued,
        add_sequencer_l2_batch_impl(
            data_hash,
            after_delayed_messages_read,
            prev_message_count,
            new_message_count,
            sequence_number));

    if (!config_.is_using_fee_token) {
        BOOST_OUTCOME_TRY(
            auto const extra_gas,
            blob_extra_gas(
                intx::be::load<uint256_t>(ctx.blob_base_fee),
                base_fee(ctx),
                hashes.size()));
        if (INBOX_UNLIKELY(
                extra_gas > std::numeric_limits<uint64_t>::max())) {
            return SequencerInboxError::ExtraGasNotUint64;
        }
        BOOST_OUTCOME_TRY(submit_batch_spending_report(
            data_hash, enqueued.seq_message_index, extra_gas, ctx));
    }

    emit_sequencer_batch_delivered(
        enqueued, after_delayed_messages_read, bounds, BatchDataLocation::Blob);
    return outcome::success();
}

Result<void> SequencerInbox::submit_batch_spending_report(
    bytes32_t const &data_hash, uint64_t const seq_message_index,
    uint256_t const &extra_gas, evmc_tx_context const &ctx)
{
    Address const batch_poster{ctx.tx_origin};

    // timestamp || batch poster || data hash || seq index || base fee ||
    // uint64 extra gas
    byte_string report;
    report += abi_encode_uint(u256_be{block_timestamp(ctx)});
    report += byte_string_view{batch_poster.bytes, sizeof(batch_poster.bytes)};
    report += data_hash;
    report += abi_encode_uint(u256_be{seq_message_index});
    report += abi_encode_uint(u256_be{base_fee(ctx)});
    u64_be const extra_gas_be{static_cast<uint64_t>(extra_gas)};
    report += byte_string_view{extra_gas_be.bytes, sizeof(extra_gas_be.bytes)};

    BOOST_OUTCOME_TRY(
        uint64_t const message_num,
        bridge_.submit_batch_spending_report(
            batch_poster, keccak256_bytes(report), ctx));
    emit_inbox_message_delivered(message_num, report);
    return outcome::success();
}

Result<void> SequencerInbox::add_sequencer_l2_batch_from_origin(
    Address const &sender, uint256_t const &sequence_number,
    byte_string_view const data, uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    evmc_tx_context const &ctx)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_batch_poster(sender, ctx, true));
        if (INBOX_UNLIKELY(is_delay_proof_required(
                sender, after_delayed_messages_read, ctx))) {
            return SequencerInboxError::DelayProofRequired;
        }
        BOOST_OUTCOME_TRY(add_calldata_batch(
            sender,
            sequence_number,
            data,
            after_delayed_messages_read,
            prev_message_count,
            new_message_count,
            BatchDataLocation::TxInput,
            ctx));
        return outcome::success();
    });
}

Result<void> SequencerInbox::add_sequencer_l2_batch(
    Address const &sender, uint256_t const &sequence_number,
    byte_string_view const data, uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    evmc_tx_context const &ctx)
{
    return execute([&]() -> Result<void> {
        if (!vars.is_batch_poster(sender).load() &&
            INBOX_UNLIKELY(sender != vars.rollup.load())) {
            return SequencerInboxError::NotBatchPoster;
        }
        if (INBOX_UNLIKELY(is_delay_proof_required(
                sender, after_delayed_messages_read, ctx))) {
            return SequencerInboxError::DelayProofRequired;
        }
        BOOST_OUTCOME_TRY(add_calldata_batch(
            sender,
            sequence_number,
            data,
            after_delayed_messages_read,
            prev_message_count,
            new_message_count,
            BatchDataLocation::SeparateBatchEvent,
            ctx));
        return outcome::success();
    });
}

Result<void> SequencerInbox::add_sequencer_l2_batch_from_blobs(
    Address const &sender, uint256_t const &sequence_number,
    uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    evmc_tx_context const &ctx)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_batch_poster(sender, ctx, false));
        if (INBOX_UNLIKELY(is_delay_proof_required(
                sender, after_delayed_messages_read, ctx))) {
            return SequencerInboxError::DelayProofRequired;
        }
        return add_blob_batch(
            sender,
            sequence_number,
            after_delayed_messages_read,
            prev_message_count,
            new_message_count,
            ctx);
    });
}

Result<void> SequencerInbox::add_sequencer_l2_batch_from_origin_delay_proof(
    Address const &sender, uint256_t const &sequence_number,
    byte_string_view const data, uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    DelayProof const &proof, evmc_tx_context const &ctx)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_batch_poster(sender, ctx, true));
        BOOST_OUTCOME_TRY(
            delay_proof_impl(sender, after_delayed_messages_read, proof, ctx));
        BOOST_OUTCOME_TRY(add_calldata_batch(
            sender,
            sequence_number,
            data,
            after_delayed_messages_read,
            prev_message_count,
            new_message_count,
            BatchDataLocation::TxInput,
            ctx));
        return outcome::success();
    });
}

Result<void> SequencerInbox::add_sequencer_l2_batch_from_blobs_delay_proof(
    Address const &sender, uint256_t const &sequence_number,
    uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    DelayProof const &proof, evmc_tx_context const &ctx)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_batch_poster(sender, ctx, false));
        BOOST_OUTCOME_TRY(
            delay_proof_impl(sender, after_delayed_messages_read, proof, ctx));
        return add_blob_batch(
            sender,
            sequence_number,
            after_delayed_messages_read,
            prev_message_count,
            new_message_count,
            ctx);
    });
}

Result<void> SequencerInbox::add_sequencer_l2_batch_from_origin_resync_proof(
    Address const &sender, uint256_t const &sequence_number,
    byte_string_view const data, uint64_t const after_delayed_messages_read,
    uint256_t const &prev_message_count, uint256_t const &new_message_count,
    ResyncProof const &proof, evmc_tx_context const &ctx)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_batch_poster(sender, ctx, true));
        if (INBOX_UNLIKELY(!is_delay_bufferable())) {
            return SequencerInboxError::NotDelayBufferable;
        }
        uint64_t const read = bridge_.total_delayed_messages_read();
        if (INBOX_UNLIKELY(after_delayed_messages_read <= read)) {
            return SequencerInboxError::NotDelayedFarEnough;
        }
        if (INBOX_UNLIKELY(read >= bridge_.delayed_message_count())) {
            return SequencerInboxError::DelayedTooFar;
        }
        BOOST_OUTCOME_TRY(verify_delay_proof(bridge_, read, proof.first));
        auto const &first = proof.first.delayed_message;
        update_buffers(first.block_number, first.timestamp, ctx);

        BOOST_OUTCOME_TRY(
            auto const enqueued,
            add_calldata_batch(
                sender,
                sequence_number,
                data,
                after_delayed_messages_read,
                prev_message_count,
                new_message_count,
                BatchDataLocation::TxInput,
                ctx));

        // only known once the ledger has bound the batch to its delayed
        // accumulator
        BOOST_OUTCOME_TRY(verify_delay_proof(enqueued.delayed_acc, proof.last));

        auto const &last = proof.last.delayed_message;
        update_buffers(last.block_number, last.timestamp, ctx);
        refresh_sync_cache(sender, last);
        return outcome::success();
    });
}

Result<void> SequencerInbox::add_sequencer_l2_batch_from_origin_legacy(
    Address const &, uint256_t const &, byte_string_view, uint64_t,
    evmc_tx_context const &)
{
    return SequencerInboxError::Deprecated;
}

Result<void> SequencerInbox::force_inclusion(
    uint64_t const total_delayed_messages_read, uint8_t const kind,
    uint64_t const msg_block_number, uint64_t const msg_timestamp,
    uint256_t const &base_fee_l1, Address const &sender,
    bytes32_t const &message_data_hash, evmc_tx_context const &ctx)
{
    return execute([&]() -> Result<void> {
        if (INBOX_UNLIKELY(
                total_delayed_messages_read == 0 ||
                total_delayed_messages_read <=
                    bridge_.total_delayed_messages_read())) {
            return SequencerInboxError::DelayedBackwards;
        }
        if (INBOX_UNLIKELY(
                total_delayed_messages_read >
                bridge_.delayed_message_count())) {
            return SequencerInboxError::DelayedTooFar;
        }

        DelayedMessage const msg{
            .kind = kind,
            .sender = sender,
            .block_number = msg_block_number,
            .timestamp = msg_timestamp,
            .inbox_seq_num = total_delayed_messages_read - 1,
            .base_fee_l1 = base_fee_l1,
            .message_data_hash = message_data_hash};
        bytes32_t prev_delayed_acc{};
        if (total_delayed_messages_read > 1) {
            BOOST_OUTCOME_TRY(
                prev_delayed_acc,
                bridge_.delayed_inbox_accs(total_delayed_messages_read - 2));
        }
        BOOST_OUTCOME_TRY(
            auto const delayed_acc,
            bridge_.delayed_inbox_accs(total_delayed_messages_read - 1));
        if (INBOX_UNLIKELY(
                accumulate_message(prev_delayed_acc, message_hash(msg)) !=
                delayed_acc)) {
            return SequencerInboxError::IncorrectMessagePreimage;
        }

        // the deadline is checked against the buffer as of this message
        if (is_delay_bufferable()) {
            update_buffers(msg_block_number, msg_timestamp, ctx);
        }

        TimeVariation const variation =
            effective_time_variation(std::nullopt, ctx);
        if (INBOX_UNLIKELY(
                saturating_add(msg_block_number, variation.delay_blocks) >=
                block_number(ctx))) {
            return SequencerInboxError::ForceIncludeBlockTooSoon;
        }
        if (INBOX_UNLIKELY(
                saturating_add(msg_timestamp, variation.delay_seconds) >=
                block_timestamp(ctx))) {
            return SequencerInboxError::ForceIncludeTimeTooSoon;
        }

        TimeBounds const bounds =
            time_bounds(variation, block_number(ctx), block_timestamp(ctx));
        uint256_t const message_count =
            bridge_.sequencer_reported_sub_message_count();
        BOOST_OUTCOME_TRY(
            auto const enqueued,
            add_sequencer_l2_batch_impl(
                empty_hash(encode_header(bounds, total_delayed_messages_read)),
                total_delayed_messages_read,
                message_count,
                message_count,
                UINT256_MAX));
        emit_sequencer_batch_delivered(
            enqueued,
            total_delayed_messages_read,
            bounds,
            BatchDataLocation::NoData);

        LOG_INFO(
            "SequencerInbox: force included delayed messages up to {} in "
            "batch {}",
            total_delayed_messages_read,
            enqueued.seq_message_index);
        return outcome::success();
    });
}

////////////////////////
// Admin              //
////////////////////////

Result<void> SequencerInbox::set_max_time_variation(
    Address const &sender, TimeVariation const &variation)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_rollup_owner(sender));
        BOOST_OUTCOME_TRY(validate_time_variation(variation));
        if (INBOX_UNLIKELY(validate_buffer_config(
                               config_.buffer_config,
                               config_.replenish_rate,
                               variation)
                               .has_error())) {
            return SequencerInboxError::BadMaxTimeVariation;
        }
        vars.max_time_variation.store(MaxTimeVariation{
            .delay_blocks = variation.delay_blocks,
            .future_blocks = variation.future_blocks,
            .delay_seconds = variation.delay_seconds,
            .future_seconds = variation.future_seconds});
        emit_owner_function_called(OwnerFunction::SetMaxTimeVariation);
        return outcome::success();
    });
}

Result<void> SequencerInbox::set_is_batch_poster(
    Address const &sender, Address const &addr, bool const is_batch_poster)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_rollup_owner_or_batch_poster_manager(sender));
        vars.is_batch_poster(addr).store(is_batch_poster);
        emit_batch_poster_set(addr, is_batch_poster);
        emit_owner_function_called(OwnerFunction::SetIsBatchPoster);
        LOG_INFO(
            "SequencerInbox: batch poster {} set to {}", addr, is_batch_poster);
        return outcome::success();
    });
}

Result<void> SequencerInbox::set_is_sequencer(
    Address const &sender, Address const &addr, bool const is_sequencer)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_rollup_owner_or_batch_poster_manager(sender));
        vars.is_sequencer(addr).store(is_sequencer);
        emit_sequencer_set(addr, is_sequencer);
        emit_owner_function_called(OwnerFunction::SetIsSequencer);
        return outcome::success();
    });
}

Result<void> SequencerInbox::set_batch_poster_manager(
    Address const &sender, Address const &manager)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_rollup_owner(sender));
        vars.batch_poster_manager.store(manager);
        emit_batch_poster_manager_set(manager);
        emit_owner_function_called(OwnerFunction::SetBatchPosterManager);
        return outcome::success();
    });
}

Result<void> SequencerInbox::set_valid_keyset(
    Address const &sender, byte_string_view const keyset_bytes,
    evmc_tx_context const &ctx)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_rollup_owner(sender));
        if (INBOX_UNLIKELY(keyset_bytes.size() >= MAX_KEYSET_SIZE)) {
            return SequencerInboxError::KeysetTooLarge;
        }
        bytes32_t const hash = keyset_hash(keyset_bytes);
        auto info = vars.keyset_info(hash);
        if (INBOX_UNLIKELY(info.load().is_valid_keyset)) {
            return SequencerInboxError::AlreadyValidDASKeyset;
        }
        info.store(KeysetInfo{
            .is_valid_keyset = true, .creation_block = block_number(ctx)});
        emit_set_valid_keyset(hash, keyset_bytes);
        emit_owner_function_called(OwnerFunction::SetValidKeyset);
        return outcome::success();
    });
}

Result<void> SequencerInbox::invalidate_keyset_hash(
    Address const &sender, bytes32_t const &hash)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_rollup_owner(sender));
        auto info = vars.keyset_info(hash);
        KeysetInfo current = info.load();
        if (INBOX_UNLIKELY(!current.is_valid_keyset)) {
            return SequencerInboxError::NoSuchKeyset;
        }
        // creation block is kept for historical lookups
        current.is_valid_keyset = false;
        info.store(current);
        emit_invalidate_keyset(hash);
        emit_owner_function_called(OwnerFunction::InvalidateKeysetHash);
        return outcome::success();
    });
}

Result<void> SequencerInbox::update_rollup_address(Address const &sender)
{
    return execute([&]() -> Result<void> {
        BOOST_OUTCOME_TRY(only_rollup_owner(sender));
        Address const rollup = bridge_.rollup();
        if (INBOX_UNLIKELY(rollup == vars.rollup.load())) {
            return SequencerInboxError::RollupNotChanged;
        }
        vars.rollup.store(rollup);
        emit_owner_function_called(OwnerFunction::UpdateRollupAddress);
        LOG_INFO("SequencerInbox: rollup address updated to {}", rollup);
        return outcome::success();
    });
}

////////////////////////
// Queries            //
////////////////////////

TimeVariation
SequencerInbox::max_time_variation(evmc_tx_context const &ctx) const
{
    return effective_time_variation(std::nullopt, ctx);
}

TimeVariation SequencerInbox::max_time_variation_for(
    Address const &caller, evmc_tx_context const &ctx) const
{
    return effective_time_variation(caller, ctx);
}

bool SequencerInbox::is_delay_bufferable() const
{
    return inbox::is_delay_bufferable(config_.buffer_config);
}

bool SequencerInbox::is_delay_proof_required(
    Address const &sender, uint64_t const after_delayed_messages_read,
    evmc_tx_context const &ctx) const
{
    if (!is_delay_bufferable() || chain_id_changed(ctx)) {
        return false;
    }
    if (after_delayed_messages_read <= bridge_.total_delayed_messages_read()) {
        return false;
    }
    return !is_synced(
        sync_cache(sender),
        buffer(),
        config_.buffer_config,
        block_number(ctx),
        block_timestamp(ctx));
}

uint64_t SequencerInbox::batch_count() const
{
    return bridge_.sequencer_message_count();
}

Result<bytes32_t> SequencerInbox::inbox_accs(uint64_t const index) const
{
    return bridge_.sequencer_inbox_accs(index);
}

uint64_t SequencerInbox::total_delayed_messages_read() const
{
    return bridge_.total_delayed_messages_read();
}

bool SequencerInbox::is_valid_keyset_hash(bytes32_t const &hash) const
{
    return vars.keyset_info(hash).load().is_valid_keyset;
}

Result<uint64_t>
SequencerInbox::get_keyset_creation_block(bytes32_t const &hash) const
{
    auto const info = vars.keyset_info(hash).load_checked();
    if (INBOX_UNLIKELY(!info.has_value())) {
        return SequencerInboxError::NoSuchKeyset;
    }
    return info->creation_block.native();
}

bool SequencerInbox::is_batch_poster(Address const &addr) const
{
    return vars.is_batch_poster(addr).load();
}

bool SequencerInbox::is_sequencer(Address const &addr) const
{
    return vars.is_sequencer(addr).load();
}

DelayBufferState SequencerInbox::buffer() const
{
    return from_storage(vars.buffer.load());
}

SyncCache SequencerInbox::sync_cache(Address const &caller) const
{
    SyncExpiry const expiry = vars.sync_cache(caller).load();
    return SyncCache{
        .expiry_block_number = expiry.block_number.native(),
        .expiry_timestamp = expiry.timestamp.native()};
}

Address SequencerInbox::rollup() const
{
    return vars.rollup.load();
}

Address SequencerInbox::batch_poster_manager() const
{
    return vars.batch_poster_manager.load();
}

/////////////
// Events //
/////////////

void SequencerInbox::emit_sequencer_batch_delivered(
    SequencerMessageEnqueued const &enqueued,
    uint64_t const after_delayed_messages_read, TimeBounds const &bounds,
    BatchDataLocation const location)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "SequencerBatchDelivered(uint256,bytes32,bytes32,bytes32,uint256,("
        "uint64,uint64,uint64,uint64),uint8)");
    static_assert(
        signature ==
        0x7394f4a19a13c7b92b5bb71033245305946ef78452f7b4986ac1390b5df4ebd7_bytes32);

    AbiEncoder encoder;
    encoder.add_bytes32(enqueued.delayed_acc);
    encoder.add_uint(u256_be{after_delayed_messages_read});
    encoder.add_uint(u64_be{bounds.min_timestamp});
    encoder.add_uint(u64_be{bounds.max_timestamp});
    encoder.add_uint(u64_be{bounds.min_block_number});
    encoder.add_uint(u64_be{bounds.max_block_number});
    encoder.add_uint(u8_be{static_cast<uint8_t>(location)});

    auto const event =
        EventBuilder(address_, signature)
            .add_topic(abi_encode_uint(u256_be{enqueued.seq_message_index}))
            .add_topic(enqueued.before_acc)
            .add_topic(enqueued.acc)
            .add_data(encoder.encode_final())
            .build();
    state_.store_log(event);

    LOG_DEBUG(
        "SequencerInbox: batch {} delivered, acc {}, delayed read {}",
        enqueued.seq_message_index,
        enqueued.acc,
        after_delayed_messages_read);
}

void SequencerInbox::emit_sequencer_batch_data(
    uint64_t const seq_message_index, byte_string_view const data)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("SequencerBatchData(uint256,bytes)");
    static_assert(
        signature ==
        0xfe325ca1efe4c5c1062c981c3ee74b781debe4ea9440306a96d2a55759c66c20_bytes32);

    AbiEncoder encoder;
    encoder.add_bytes(data);

    auto const event =
        EventBuilder(address_, signature)
            .add_topic(abi_encode_uint(u256_be{seq_message_index}))
            .add_data(encoder.encode_final())
            .build();
    state_.store_log(event);
}

void SequencerInbox::emit_inbox_message_delivered(
    uint64_t const message_num, byte_string_view const data)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("InboxMessageDelivered(uint256,bytes)");
    static_assert(
        signature ==
        0xff64905f73a67fb594e0f940a8075a860db489ad991e032f48c81123eb52d60b_bytes32);

    AbiEncoder encoder;
    encoder.add_bytes(data);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(abi_encode_uint(u256_be{message_num}))
                           .add_data(encoder.encode_final())
                           .build();
    state_.store_log(event);
}

void SequencerInbox::emit_owner_function_called(uint64_t const id)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("OwnerFunctionCalled(uint256)");
    static_assert(
        signature ==
        0xea8787f128d10b2cc0317b0c3960f9ad447f7f6c1ed189db1083ccffd20f456e_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(abi_encode_uint(u256_be{id}))
                           .build();
    state_.store_log(event);
}

void SequencerInbox::emit_set_valid_keyset(
    bytes32_t const &hash, byte_string_view const keyset_bytes)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("SetValidKeyset(bytes32,bytes)");
    static_assert(
        signature ==
        0xabca9b7986bc22ad0160eb0cb88ae75411eacfba4052af0b457a9335ef655722_bytes32);

    AbiEncoder encoder;
    encoder.add_bytes(keyset_bytes);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(hash)
                           .add_data(encoder.encode_final())
                           .build();
    state_.store_log(event);
}

void SequencerInbox::emit_invalidate_keyset(bytes32_t const &hash)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("InvalidateKeyset(bytes32)");
    static_assert(
        signature ==
        0x5cb4218b272fd214168ac43e90fb4d05d6c36f0b17ffb4c2dd07c234d744eb2a_bytes32);

    auto const event =
        EventBuilder(address_, signature).add_topic(hash).build();
    state_.store_log(event);
}

void SequencerInbox::emit_batch_poster_set(
    Address const &addr, bool const is_batch_poster)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("BatchPosterSet(address,bool)");
    static_assert(
        signature ==
        0x28bcc5626d357efe966b4b0876aa1ee8ab99e26da4f131f6a2623f1800701c21_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(abi_encode_address(addr))
                           .add_data(abi_encode_bool(is_batch_poster))
                           .build();
    state_.store_log(event);
}

void SequencerInbox::emit_sequencer_set(
    Address const &addr, bool const is_sequencer)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("SequencerSet(address,bool)");
    static_assert(
        signature ==
        0xeb12a9a53eec138c91b27b4f912a257bd690c18fc8bde744be92a0365eb9b87e_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(abi_encode_address(addr))
                           .add_data(abi_encode_bool(is_sequencer))
                           .build();
    state_.store_log(event);
}

void SequencerInbox::emit_batch_poster_manager_set(Address const &manager)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("BatchPosterManagerSet(address)");
    static_assert(
        signature ==
        0x3cd6c184800297a0f2b00926a683cbe76890bb7fd01480ac0a10ed6c8f7f6659_bytes32);

    auto const event = EventBuilder(address_, signature)
                           .add_topic(abi_encode_address(manager))
                           .build();
    state_.store_log(event);
}

INBOX_NAMESPACE_END
