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

#include <inbox/core/likely.h>
#include <inbox/sequencer/inbox_config.hpp>
#include <inbox/sequencer/sequencer_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstdint>
#include <limits>

INBOX_NAMESPACE_BEGIN

Result<void> validate_time_variation(TimeVariation const &variation)
{
    constexpr uint64_t max = std::numeric_limits<int64_t>::max();
    if (INBOX_UNLIKELY(
            variation.delay_blocks > max || variation.future_blocks > max ||
            variation.delay_seconds > max || variation.future_seconds > max)) {
        return SequencerInboxError::BadMaxTimeVariation;
    }
    return outcome::success();
}

Result<void> validate_buffer_config(
    BufferConfig const &config, ReplenishRate const &rate,
    TimeVariation const &variation)
{
    bool const blocks_off = config.threshold_blocks == UNBUFFERED_THRESHOLD;
    bool const seconds_off = config.threshold_seconds == UNBUFFERED_THRESHOLD;
    if (blocks_off && seconds_off) {
        return outcome::success();
    }
    // a sentinel in one dimension would leave the other unbounded
    constexpr uint64_t max = std::numeric_limits<int64_t>::max();
    if (INBOX_UNLIKELY(
            blocks_off || seconds_off || config.threshold_blocks > max ||
            config.threshold_seconds > max || config.max_buffer_blocks > max ||
            config.max_buffer_seconds > max)) {
        return SequencerInboxError::BadBufferConfig;
    }
    bool const blocks_ok =
        config.threshold_blocks <= config.max_buffer_blocks &&
        config.max_buffer_blocks >= variation.delay_blocks &&
        rate.period_blocks > 0 && rate.blocks_per_period <= rate.period_blocks;
    bool const seconds_ok =
        config.threshold_seconds <= config.max_buffer_seconds &&
        config.max_buffer_seconds >= variation.delay_seconds &&
        rate.period_seconds > 0 &&
        rate.seconds_per_period <= rate.period_seconds;
    if (INBOX_UNLIKELY(!blocks_ok || !seconds_ok)) {
        return SequencerInboxError::BadBufferConfig;
    }
    return outcome::success();
}

Result<void> validate_inbox_config(InboxConfig const &config)
{
    BOOST_OUTCOME_TRY(validate_time_variation(config.max_time_variation));
    return validate_buffer_config(
        config.buffer_config, config.replenish_rate, config.max_time_variation);
}

INBOX_NAMESPACE_END
