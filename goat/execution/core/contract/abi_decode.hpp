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
#include <goat/core/likely.h>
#include <goat/core/result.hpp>
#include <goat/execution/core/address.hpp>
#include <goat/execution/core/contract/abi_decode_error.hpp>
#include <goat/execution/core/contract/big_endian.hpp>

#include <concepts>
#include <cstring>

GOAT_NAMESPACE_BEGIN

// Reads one 32-byte word from the front of enc. Values narrower than a word
// are taken from its low-order bytes; the high-order bytes are skipped
// without inspection.
template <typename T>
    requires(
        BigEndianType<T> || std::same_as<T, Address> ||
        std::same_as<T, bytes32_t>)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    static_assert(sizeof(T) <= 32);
    if (GOAT_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }

    constexpr size_t offset = 32 - sizeof(T);
    T output{};
    std::memcpy(&output, enc.data() + offset, sizeof(T));
    enc.remove_prefix(32);
    return output;
}

GOAT_NAMESPACE_END
