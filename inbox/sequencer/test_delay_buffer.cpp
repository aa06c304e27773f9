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

#include <inbox/sequencer/batch_header.hpp>
#include <inbox/sequencer/delay_buffer.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace inbox;

namespace
{
    constexpr BufferConfig CONFIG{
        .threshold_blocks = 10,
        .threshold_seconds = 120,
        .max_buffer_blocks = 100,
        .max_buffer_seconds = 1200};

    constexpr ReplenishRate RATE{
        .blocks_per_period = 1,
        .seconds_per_period = 12,
        .period_blocks = 10,
        .period_seconds = 120};

    constexpr TimeVariation STRICT{
        .delay_blocks = 20,
        .future_blocks = 4,
        .delay_seconds = 240,
        .future_seconds = 48};
}

TEST(DelayBuffer, bufferable)
{
    EXPECT_TRUE(is_delay_bufferable(CONFIG));
    EXPECT_FALSE(is_delay_bufferable(BufferConfig{}));
    EXPECT_TRUE(is_full(full_buffer(CONFIG), CONFIG));
}

TEST(DelayBuffer, calc_buffer_depletes_past_threshold)
{
    // 25 blocks late with a threshold of 10
    EXPECT_EQ(calc_buffer(100, 25, 100, 10, 100, 1, 10), 85);
    // depletion is capped at the elapsed distance
    EXPECT_EQ(calc_buffer(5, 25, 50, 10, 100, 1, 10), 45);
    // within the threshold nothing is charged
    EXPECT_EQ(calc_buffer(100, 10, 50, 10, 100, 1, 10), 60);
}

TEST(DelayBuffer, calc_buffer_replenish_floors_whole_periods)
{
    EXPECT_EQ(calc_buffer(9, 0, 50, 10, 100, 1, 10), 50);
    EXPECT_EQ(calc_buffer(10, 0, 50, 10, 100, 1, 10), 51);
    EXPECT_EQ(calc_buffer(19, 0, 50, 10, 100, 1, 10), 51);
    EXPECT_EQ(calc_buffer(20, 0, 50, 10, 100, 1, 10), 52);
}

TEST(DelayBuffer, calc_buffer_clamps)
{
    // never above max
    EXPECT_EQ(calc_buffer(1'000'000, 0, 99, 10, 100, 1, 10), 100);
    // never below zero
    EXPECT_EQ(calc_buffer(1'000, 1'000, 5, 10, 100, 1, 10), 0);
    // huge elapsed does not overflow
    EXPECT_EQ(
        calc_buffer(
            std::numeric_limits<uint64_t>::max(),
            0,
            0,
            10,
            100,
            std::numeric_limits<uint64_t>::max(),
            1),
        100);
}

TEST(DelayBuffer, replenishment_is_monotone)
{
    uint64_t last = 0;
    for (uint64_t elapsed = 0; elapsed < 500; elapsed += 7) {
        uint64_t const value = calc_buffer(elapsed, 0, 30, 10, 100, 1, 10);
        EXPECT_GE(value, last);
        last = value;
    }
}

TEST(DelayBuffer, update_charges_previous_delay)
{
    DelayBufferState state = full_buffer(CONFIG);

    // message at block 100 sequenced at block 150: 50 late
    state = update_buffer(state, CONFIG, RATE, 100, 1000, 150, 1600);
    EXPECT_EQ(state.buffer_blocks, 100);
    EXPECT_EQ(state.prev_block_number, 100);
    EXPECT_EQ(state.prev_sequenced_block_number, 150);

    // the next update charges 50 - 10 blocks and 600 - 120 seconds, less
    // replenishment over 60 blocks and 600 seconds
    state = update_buffer(state, CONFIG, RATE, 160, 1600, 170, 1700);
    EXPECT_EQ(state.buffer_blocks, 100 - 40);
    EXPECT_EQ(state.buffer_seconds, 1200 - 480);
    EXPECT_FALSE(is_full(state, CONFIG));
}

TEST(DelayBuffer, update_never_moves_reference_backwards)
{
    DelayBufferState state = full_buffer(CONFIG);
    state = update_buffer(state, CONFIG, RATE, 100, 1000, 105, 1050);
    state = update_buffer(state, CONFIG, RATE, 90, 900, 106, 1060);
    EXPECT_EQ(state.prev_block_number, 100);
    EXPECT_EQ(state.prev_timestamp, 1000);
    EXPECT_EQ(state.prev_sequenced_block_number, 106);
}

TEST(DelayBuffer, sync_cache)
{
    DelayBufferState const full = full_buffer(CONFIG);
    SyncCache const cache = make_sync_cache(CONFIG, 100, 1000);
    EXPECT_EQ(cache.expiry_block_number, 110);
    EXPECT_EQ(cache.expiry_timestamp, 1120);

    EXPECT_TRUE(is_synced(cache, full, CONFIG, 110, 1120));
    EXPECT_FALSE(is_synced(cache, full, CONFIG, 111, 1120));
    EXPECT_FALSE(is_synced(cache, full, CONFIG, 110, 1121));
    EXPECT_FALSE(is_synced(SyncCache{}, full, CONFIG, 0, 0));

    DelayBufferState drained = full;
    drained.buffer_blocks = 99;
    EXPECT_FALSE(is_synced(cache, drained, CONFIG, 105, 1050));
}

TEST(DelayBuffer, buffered_time_variation)
{
    DelayBufferState state = full_buffer(CONFIG);
    state.buffer_blocks = 30;
    state.buffer_seconds = 100;

    auto const unsynced = buffered_time_variation(STRICT, state, CONFIG, false);
    EXPECT_EQ(unsynced.delay_blocks, 30);
    EXPECT_EQ(unsynced.delay_seconds, 240);
    EXPECT_EQ(unsynced.future_blocks, STRICT.future_blocks);
    EXPECT_EQ(unsynced.future_seconds, STRICT.future_seconds);

    auto const synced = buffered_time_variation(STRICT, state, CONFIG, true);
    EXPECT_EQ(synced.delay_blocks, 100);
    EXPECT_EQ(synced.delay_seconds, 1200);
}
