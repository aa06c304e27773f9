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
#include <inbox/core/likely.h>
#include <inbox/sequencer/delay_proof.hpp>
#include <inbox/sequencer/sequencer_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

INBOX_NAMESPACE_BEGIN

bool is_valid_preimage(DelayProof const &proof, bytes32_t const &target)
{
    return accumulate_message(
               proof.before_delayed_acc, message_hash(proof.delayed_message)) ==
           target;
}

Result<void> verify_delay_proof(
    IBridge const &bridge, uint64_t const index, DelayProof const &proof)
{
    BOOST_OUTCOME_TRY(auto const target, bridge.delayed_inbox_accs(index));
    return verify_delay_proof(target, proof);
}

Result<void>
verify_delay_proof(bytes32_t const &delayed_acc, DelayProof const &proof)
{
    if (INBOX_UNLIKELY(!is_valid_preimage(proof, delayed_acc))) {
        return SequencerInboxError::InvalidDelayedAccPreimage;
    }
    return outcome::success();
}

INBOX_NAMESPACE_END
