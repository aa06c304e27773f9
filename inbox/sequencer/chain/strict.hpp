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
#include <inbox/sequencer/chain/chain.hpp>

INBOX_NAMESPACE_BEGIN

// Delay buffer disabled: delayed messages are force-includable after the
// fixed 24 hour window.
struct StrictChain : Chain
{
    uint256_t get_chain_id() const override;
    InboxConfig get_inbox_config() const override;
};

INBOX_NAMESPACE_END
