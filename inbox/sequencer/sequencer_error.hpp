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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

INBOX_NAMESPACE_BEGIN

enum class SequencerInboxError
{
    Success = 0,
    AlreadyInit,
    NotInitialized,
    NotOrigin,
    NotBatchPoster,
    NotOwner,
    NotBatchPosterManager,
    DataTooLarge,
    InvalidHeaderFlag,
    InvalidHeaderLength,
    NoSuchKeyset,
    MissingDataHashes,
    ExtraGasNotUint64,
    DelayedBackwards,
    DelayedTooFar,
    BadSequencerNumber,
    DelayProofRequired,
    NotDelayBufferable,
    NotDelayedFarEnough,
    InvalidDelayedAccPreimage,
    IncorrectMessagePreimage,
    ForceIncludeBlockTooSoon,
    ForceIncludeTimeTooSoon,
    Deprecated,
    BadMaxTimeVariation,
    BadBufferConfig,
    KeysetTooLarge,
    AlreadyValidDASKeyset,
    RollupNotChanged,
};

INBOX_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<inbox::SequencerInboxError>
    : quick_status_code_from_enum_defaults<inbox::SequencerInboxError>
{
    static constexpr auto const domain_name = "Sequencer Inbox Error";
    static constexpr auto const domain_uuid =
        "e2b6c91d-5f3a-4c87-b04e-9d1a6f28c3b5";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
