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

#include <inbox/core/assert.h>
#include <inbox/sequencer/chain/chain.hpp>
#include <inbox/sequencer/chain/devnet.hpp>
#include <inbox/sequencer/chain/nova.hpp>
#include <inbox/sequencer/chain/strict.hpp>

#include <memory>

INBOX_NAMESPACE_BEGIN

std::unique_ptr<Chain> make_chain(inbox_chain_config const config)
{
    switch (config) {
    case CHAIN_CONFIG_STRICT:
        return std::make_unique<StrictChain>();
    case CHAIN_CONFIG_NOVA:
        return std::make_unique<NovaChain>();
    case CHAIN_CONFIG_DEVNET:
        return std::make_unique<DevnetChain>();
    }
    INBOX_ABORT("unknown chain config");
}

INBOX_NAMESPACE_END
