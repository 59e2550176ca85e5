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

#include <goat/core/byte_string.hpp>
#include <goat/core/bytes.hpp>
#include <goat/core/config.hpp>
#include <goat/core/int.hpp>
#include <goat/core/result.hpp>
#include <goat/execution/core/address.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>

GOAT_NAMESPACE_BEGIN

/// Forward-only cursor over the argument words of a fixed-layout goat payload
class CalldataReader
{
    byte_string_view args_;

    explicit CalldataReader(byte_string_view const args)
        : args_{args}
    {
    }

public:
    static constexpr size_t SELECTOR_SIZE = 4;
    static constexpr size_t WORD_SIZE = 32;

    /// Checks that input is exactly size bytes long and begins with selector.
    /// name only labels the debug log line of a rejected payload.
    static Result<CalldataReader> open(
        byte_string_view input, size_t size, uint32_t selector,
        char const *name);

    Result<bytes32_t> read_bytes32();
    Result<uint256_t> read_uint256();
    Result<uint64_t> read_uint64();
    Result<uint32_t> read_uint32();
    Result<Address> read_address();

    size_t remaining() const noexcept
    {
        return args_.size();
    }
};

/// Inverse of CalldataReader: selector followed by the given words
byte_string
encode_calldata(uint32_t selector, std::initializer_list<bytes32_t> words);

GOAT_NAMESPACE_END
