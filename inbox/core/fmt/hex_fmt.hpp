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
#include <inbox/core/basic_formatter.hpp>
#include <inbox/core/bytes.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <span>
#include <concepts>
#include <type_traits>

INBOX_NAMESPACE_BEGIN

template <typename T>
concept FixedBytes =
    std::same_as<T, Address> || std::same_as<T, bytes32_t>;

// 0x-prefixed lowercase hex, the form accepted by the inbox_tool options
struct HexFormatter : public BasicFormatter
{
    template <FixedBytes T, typename FormatContext>
    auto format(T const &value, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "0x{:02x}",
            fmt::join(std::as_bytes(std::span(value.bytes)), ""));
        return ctx.out();
    }
};

INBOX_NAMESPACE_END

template <>
struct quill::copy_loggable<inbox::Address> : std::true_type
{
};

template <>
struct quill::copy_loggable<inbox::bytes32_t> : std::true_type
{
};

template <>
struct fmt::formatter<inbox::Address> : public inbox::HexFormatter
{
};

template <>
struct fmt::formatter<inbox::bytes32_t> : public inbox::HexFormatter
{
};
