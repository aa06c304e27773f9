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

#include <inbox/core/math.hpp>
#include <inbox/sequencer/delay_buffer.hpp>

#include <algorithm>
#include <limits>

INBOX_NAMESPACE_BEGIN

bool is_delay_bufferable(BufferConfig const &config)
{
    return config.threshold_blocks != UNBUFFERED_THRESHOLD;
}

DelayBufferState full_buffer(BufferConfig const &config)
{
    return DelayBufferState{
        .buffer_blocks = config.max_buffer_blocks,
        .buffer_seconds = config.max_buffer_seconds};
}

bool is_full(DelayBufferState const &state, BufferConfig const &config)
{
    return state.buffer_blocks == config.max_buffer_blocks &&
           state.buffer_seconds == config.max_buffer_seconds;
}

uint64_t calc_buffer(
    uint64_t const elapsed, uint64_t const delay, uint64_t const buffer,
    uint64_t const threshold, uint64_t const max_buffer,
    uint64_t const per_period, uint64_t const period)
{
    uint64_t const unexpected =
        std::min(saturating_sub(delay, threshold), elapsed);
    uint64_t replenish = 0;
    if (period > 0) {
        uint64_t const periods = elapsed / period;
        replenish = periods > std::numeric_limits<uint64_t>::max() /
                                  std::max<uint64_t>(per_period, 1)
                        ? std::numeric_limits<uint64_t>::max()
                        : periods * per_period;
    }
    uint64_t const replenished =
        std::min(saturating_add(buffer, replenish), max_buffer);
    return saturating_sub(replenished, unexpected);
}

DelayBufferState update_buffer(
    DelayBufferState const &prev, BufferConfig const &config,
    ReplenishRate const &rate, uint64_t const msg_block_number,
    uint64_t const msg_timestamp, uint64_t const block_number,
    uint64_t const timestamp)
{
    DelayBufferState next = prev;

    next.buffer_blocks = calc_buffer(
        saturating_sub(msg_block_number, prev.prev_block_number),
        saturating_sub(
            prev.prev_sequenced_block_number, prev.prev_block_number),
        prev.buffer_blocks,
        config.threshold_blocks,
        config.max_buffer_blocks,
        rate.blocks_per_period,
        rate.period_blocks);
    next.buffer_seconds = calc_buffer(
        saturating_sub(msg_timestamp, prev.prev_timestamp),
        saturating_sub(prev.prev_sequenced_timestamp, prev.prev_timestamp),
        prev.buffer_seconds,
        config.threshold_seconds,
        config.max_buffer_seconds,
        rate.seconds_per_period,
        rate.period_seconds);

    next.prev_block_number = std::max(prev.prev_block_number, msg_block_number);
    next.prev_timestamp = std::max(prev.prev_timestamp, msg_timestamp);
    next.prev_sequenced_block_number = block_number;
    next.prev_sequenced_timestamp = timestamp;
    return next;
}

SyncCache make_sync_cache(
    BufferConfig const &config, uint64_t const anchor_block_number,
    uint64_t const anchor_timestamp)
{
    return SyncCache{
        .expiry_block_number =
            saturating_add(anchor_block_number, config.threshold_blocks),
        .expiry_timestamp =
            saturating_add(anchor_timestamp, config.threshold_seconds)};
}

bool is_synced(
    SyncCache const &cache, DelayBufferState const &state,
    BufferConfig const &config, uint64_t const block_number,
    uint64_t const timestamp)
{
    if (cache == SyncCache{}) {
        return false;
    }
    return block_number <= cache.expiry_block_number &&
           timestamp <= cache.expiry_timestamp && is_full(state, config);
}

TimeVariation buffered_time_variation(
    TimeVariation const &strict, DelayBufferState const &state,
    BufferConfig const &config, bool const synced)
{
    uint64_t const buffer_blocks =
        synced ? config.max_buffer_blocks : state.buffer_blocks;
    uint64_t const buffer_seconds =
        synced ? config.max_buffer_seconds : state.buffer_seconds;
    return TimeVariation{
        .delay_blocks = std::max(strict.delay_blocks, buffer_blocks),
        .future_blocks = strict.future_blocks,
        .delay_seconds = std::max(strict.delay_seconds, buffer_seconds),
        .future_seconds = strict.future_seconds};
}

INBOX_NAMESPACE_END
