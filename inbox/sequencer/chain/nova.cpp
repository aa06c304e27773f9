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

#include <inbox/sequencer/chain/nova.hpp>

#include <cstdint>

INBOX_NAMESPACE_BEGIN

namespace
{
    constexpr uint64_t SECONDS_PER_BLOCK = 12;

    constexpr uint64_t minutes_to_blocks(uint64_t const minutes)
    {
        return minutes * 60 / SECONDS_PER_BLOCK;
    }
}

uint256_t NovaChain::get_chain_id() const
{
    return 1;
}

// 48 hour buffer, 30 minute threshold, 5% replenishment
InboxConfig NovaChain::get_inbox_config() const
{
    return InboxConfig{
        .max_data_size = 117964,
        .is_using_fee_token = false,
        .max_time_variation =
            {.delay_blocks = 5760,
             .future_blocks = 64,
             .delay_seconds = 86400,
             .future_seconds = 3600},
        .buffer_config =
            {.threshold_blocks = minutes_to_blocks(30),
             .threshold_seconds = 30 * 60,
             .max_buffer_blocks = minutes_to_blocks(48 * 60),
             .max_buffer_seconds = 48 * 60 * 60},
        .replenish_rate = {
            .blocks_per_period = 1,
            .seconds_per_period = SECONDS_PER_BLOCK,
            .period_blocks = 20,
            .period_seconds = 20 * SECONDS_PER_BLOCK}};
}

INBOX_NAMESPACE_END
