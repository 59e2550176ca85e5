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

#include <goat/core/assert.h>
#include <goat/core/byte_string.hpp>

#include <evmc/hex.hpp>

#include <optional>
#include <string_view>

GOAT_NAMESPACE_BEGIN

/// Parses hex with an optional 0x prefix, tolerating surrounding whitespace;
/// empty on any non-hex digit or an odd number of digits
inline std::optional<byte_string> parse_hex(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\n' ||
                          s.front() == '\t' || s.front() == '\r')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\n' ||
                          s.back() == '\t' || s.back() == '\r')) {
        s.remove_suffix(1);
    }
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
    }
    if (s.size() % 2) {
        return std::nullopt;
    }
    return evmc::from_hex(s);
}

namespace literals
{
    inline byte_string operator""_hex(char const *s)
    {
        auto res = parse_hex(s);
        GOAT_ASSERT(res.has_value());
        return std::move(res).value();
    }
}

GOAT_NAMESPACE_END
