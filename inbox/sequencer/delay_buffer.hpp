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

#include <inbox/core/config.hpp>
#include <inbox/sequencer/batch_header.hpp>

#include <cstdint>
#include <limits>

INBOX_NAMESPACE_BEGIN

// Threshold value that turns the delay buffer off.
inline constexpr uint64_t UNBUFFERED_THRESHOLD =
    std::numeric_limits<uint64_t>::max();

struct BufferConfig
{
    uint64_t threshold_blocks{UNBUFFERED_THRESHOLD};
    uint64_t threshold_seconds{UNBUFFERED_THRESHOLD};
    uint64_t max_buffer_blocks{};
    uint64_t max_buffer_seconds{};

    friend bool operator==(BufferConfig const &, BufferConfig const &) =
        default;
};

// per_period units of buffer are restored for every whole period elapsed
// between consecutive reference messages
struct ReplenishRate
{
    uint64_t blocks_per_period{};
    uint64_t seconds_per_period{};
    uint64_t period_blocks{1};
    uint64_t period_seconds{1};

    friend bool operator==(ReplenishRate const &, ReplenishRate const &) =
        default;
};

struct DelayBufferState
{
    uint64_t buffer_blocks{};
    uint64_t buffer_seconds{};
    // the delayed message the last update was made against
    uint64_t prev_block_number{};
    uint64_t prev_timestamp{};
    // when the last update was made
    uint64_t prev_sequenced_block_number{};
    uint64_t prev_sequenced_timestamp{};

    friend bool
    operator==(DelayBufferState const &, DelayBufferState const &) = default;
};

struct SyncCache
{
    uint64_t expiry_block_number{};
    uint64_t expiry_timestamp{};

    friend bool operator==(SyncCache const &, SyncCache const &) = default;
};

bool is_delay_bufferable(BufferConfig const &);

DelayBufferState full_buffer(BufferConfig const &);

bool is_full(DelayBufferState const &, BufferConfig const &);

// New buffer value for one dimension. `elapsed` is the distance between the
// previous and current reference messages, `delay` is how late the previous
// reference message was when it was sequenced. Depletion is capped at
// `elapsed` so that one late message is not charged twice.
uint64_t calc_buffer(
    uint64_t elapsed, uint64_t delay, uint64_t buffer, uint64_t threshold,
    uint64_t max_buffer, uint64_t per_period, uint64_t period);

// Accounts for the delayed message at (msg_block_number, msg_timestamp)
// being sequenced at (block_number, timestamp).
DelayBufferState update_buffer(
    DelayBufferState const &, BufferConfig const &, ReplenishRate const &,
    uint64_t msg_block_number, uint64_t msg_timestamp, uint64_t block_number,
    uint64_t timestamp);

// Cache granted after a proof anchored at the given delayed message.
SyncCache make_sync_cache(
    BufferConfig const &, uint64_t anchor_block_number,
    uint64_t anchor_timestamp);

bool is_synced(
    SyncCache const &, DelayBufferState const &, BufferConfig const &,
    uint64_t block_number, uint64_t timestamp);

// Delay bounds widen to the larger of the strict bound and the buffer; a
// synced caller gets the full buffer. Future bounds are never buffered.
TimeVariation buffered_time_variation(
    TimeVariation const &strict, DelayBufferState const &,
    BufferConfig const &, bool synced);

INBOX_NAMESPACE_END
