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

#include <inbox/sequencer/sequencer_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<inbox::SequencerInboxError>::mapping> const &
quick_status_code_from_enum<inbox::SequencerInboxError>::value_mappings()
{
    using inbox::SequencerInboxError;

    static std::initializer_list<mapping> const v = {
        {SequencerInboxError::Success, "success", {errc::success}},
        {SequencerInboxError::AlreadyInit, "already initialized", {}},
        {SequencerInboxError::NotInitialized, "not initialized", {}},
        {SequencerInboxError::NotOrigin, "sender is not tx origin", {}},
        {SequencerInboxError::NotBatchPoster, "not a batch poster", {}},
        {SequencerInboxError::NotOwner, "not the rollup owner", {}},
        {SequencerInboxError::NotBatchPosterManager,
         "not the rollup owner or batch poster manager",
         {}},
        {SequencerInboxError::DataTooLarge, "batch data too large", {}},
        {SequencerInboxError::InvalidHeaderFlag, "invalid header flag", {}},
        {SequencerInboxError::InvalidHeaderLength,
         "invalid batch header length",
         {}},
        {SequencerInboxError::NoSuchKeyset, "no such keyset", {}},
        {SequencerInboxError::MissingDataHashes, "missing blob hashes", {}},
        {SequencerInboxError::ExtraGasNotUint64,
         "extra gas does not fit in uint64",
         {}},
        {SequencerInboxError::DelayedBackwards,
         "delayed messages read backwards",
         {}},
        {SequencerInboxError::DelayedTooFar,
         "delayed messages read too far",
         {}},
        {SequencerInboxError::BadSequencerNumber,
         "bad sequencer number",
         {}},
        {SequencerInboxError::DelayProofRequired, "delay proof required", {}},
        {SequencerInboxError::NotDelayBufferable, "not delay bufferable", {}},
        {SequencerInboxError::NotDelayedFarEnough,
         "batch does not read a new delayed message",
         {}},
        {SequencerInboxError::InvalidDelayedAccPreimage,
         "invalid delayed accumulator preimage",
         {}},
        {SequencerInboxError::IncorrectMessagePreimage,
         "incorrect message preimage",
         {}},
        {SequencerInboxError::ForceIncludeBlockTooSoon,
         "force include block too soon",
         {}},
        {SequencerInboxError::ForceIncludeTimeTooSoon,
         "force include time too soon",
         {}},
        {SequencerInboxError::Deprecated, "deprecated", {}},
        {SequencerInboxError::BadMaxTimeVariation,
         "bad max time variation",
         {}},
        {SequencerInboxError::BadBufferConfig, "bad buffer config", {}},
        {SequencerInboxError::KeysetTooLarge, "keyset too large", {}},
        {SequencerInboxError::AlreadyValidDASKeyset,
         "keyset already valid",
         {}},
        {SequencerInboxError::RollupNotChanged, "rollup not changed", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
