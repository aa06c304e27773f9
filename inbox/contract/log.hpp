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

#include <inbox/core/address.hpp>
#include <inbox/core/byte_string.hpp>
#include <inbox/core/bytes.hpp>
#include <inbox/core/config.hpp>

#include <vector>

INBOX_NAMESPACE_BEGIN

struct Log
{
    byte_string data{};
    std::vector<bytes32_t> topics{};
    Address address{};

    friend bool operator==(Log const &, Log const &) = default;
};

INBOX_NAMESPACE_END
