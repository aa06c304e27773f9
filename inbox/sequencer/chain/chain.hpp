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
#include <inbox/core/int.hpp>
#include <inbox/sequencer/chain/chain_config.h>
#include <inbox/sequencer/inbox_config.hpp>

#include <memory>

INBOX_NAMESPACE_BEGIN

// A named deployment of the sequencer inbox on its host chain.
struct Chain
{
    virtual ~Chain() = default;

    // id of the chain the inbox is deployed on
    virtual uint256_t get_chain_id() const = 0;

    virtual InboxConfig get_inbox_config() const = 0;
};

std::unique_ptr<Chain> make_chain(inbox_chain_config);

INBOX_NAMESPACE_END
