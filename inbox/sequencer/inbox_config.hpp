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
#include <inbox/core/result.hpp>
#include <inbox/sequencer/batch_header.hpp>
#include <inbox/sequencer/delay_buffer.hpp>

#include <cstdint>

INBOX_NAMESPACE_BEGIN

struct InboxConfig
{
    // upper bound on HEADER_LENGTH + inline data size
    uint64_t max_data_size{};
    // chains paying fees in a custom token get no batch spending reports
    bool is_using_fee_token{false};
    // initial value; the owner may change it later
    TimeVariation max_time_variation{};
    BufferConfig buffer_config{};
    ReplenishRate replenish_rate{};
};

// Every field must fit in int64.
Result<void> validate_time_variation(TimeVariation const &);

// No-op unless buffering is enabled.
Result<void> validate_buffer_config(
    BufferConfig const &, ReplenishRate const &, TimeVariation const &);

Result<void> validate_inbox_config(InboxConfig const &);

INBOX_NAMESPACE_END
