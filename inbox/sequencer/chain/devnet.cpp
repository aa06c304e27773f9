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

#include <inbox/sequencer/chain/devnet.hpp>

INBOX_NAMESPACE_BEGIN

uint256_t DevnetChain::get_chain_id() const
{
    return 1337;
}

InboxConfig DevnetChain::get_inbox_config() const
{
    return InboxConfig{
        .max_data_size = 117964,
        .is_using_fee_token = false,
        .max_time_variation =
            {.delay_blocks = 20,
             .future_blocks = 4,
             .delay_seconds = 240,
             .future_seconds = 48},
        .buffer_config =
            {.threshold_blocks = 10,
             .threshold_seconds = 120,
             .max_buffer_blocks = 100,
             .max_buffer_seconds = 1200},
        .replenish_rate = {
            .blocks_per_period = 1,
            .seconds_per_period = 12,
            .period_blocks = 10,
            .period_seconds = 120}};
}

INBOX_NAMESPACE_END
