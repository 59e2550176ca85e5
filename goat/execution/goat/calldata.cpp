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

#include <goat/core/byte_string.hpp>
#include <goat/core/bytes.hpp>
#include <goat/core/config.hpp>
#include <goat/core/int.hpp>
#include <goat/core/likely.h>
#include <goat/core/result.hpp>
#include <goat/execution/core/address.hpp>
#include <goat/execution/core/contract/abi_decode.hpp>
#include <goat/execution/core/contract/abi_encode.hpp>
#include <goat/execution/core/contract/big_endian.hpp>
#include <goat/execution/goat/calldata.hpp>
#include <goat/execution/goat/goat_error.hpp>

#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>

GOAT_ANONYMOUS_NAMESPACE_BEGIN

// a short read after open() is a field error, not an ABI error
template <typename T>
Result<T> read_word(byte_string_view &args)
{
    auto res = abi_decode_fixed<T>(args);
    if (GOAT_UNLIKELY(res.has_error())) {
        return GoatTxError::MalformedField;
    }
    return res.assume_value();
}

GOAT_ANONYMOUS_NAMESPACE_END

GOAT_NAMESPACE_BEGIN

Result<CalldataReader> CalldataReader::open(
    byte_string_view const input, size_t const size, uint32_t const selector,
    char const *const name)
{
    if (GOAT_UNLIKELY(input.size() != size)) {
        LOG_DEBUG(
            "{} rejected: expected {} bytes, got {}", name, size, input.size());
        return make_length_mismatch(size, input.size());
    }
    if (GOAT_UNLIKELY(input.size() < SELECTOR_SIZE)) {
        return GoatTxError::MalformedField;
    }

    auto const actual = intx::be::unsafe::load<uint32_t>(input.data());
    if (GOAT_UNLIKELY(actual != selector)) {
        LOG_DEBUG(
            "{} rejected: selector {:#010x}, expected {:#010x}",
            name,
            actual,
            selector);
        return GoatTxError::SelectorMismatch;
    }

    return CalldataReader{input.substr(SELECTOR_SIZE)};
}

Result<bytes32_t> CalldataReader::read_bytes32()
{
    return read_word<bytes32_t>(args_);
}

Result<uint256_t> CalldataReader::read_uint256()
{
    BOOST_OUTCOME_TRY(auto const word, read_word<u256_be>(args_));
    return word.native();
}

Result<uint64_t> CalldataReader::read_uint64()
{
    BOOST_OUTCOME_TRY(auto const word, read_word<u64_be>(args_));
    return word.native();
}

Result<uint32_t> CalldataReader::read_uint32()
{
    BOOST_OUTCOME_TRY(auto const word, read_word<u32_be>(args_));
    return word.native();
}

Result<Address> CalldataReader::read_address()
{
    return read_word<Address>(args_);
}

byte_string encode_calldata(
    uint32_t const selector, std::initializer_list<bytes32_t> const words)
{
    byte_string output;
    output.reserve(
        CalldataReader::SELECTOR_SIZE +
        words.size() * CalldataReader::WORD_SIZE);
    output += to_byte_string_view(abi_encode_selector_bytes(selector));
    for (auto const &word : words) {
        output += to_byte_string_view(word.bytes);
    }
    return output;
}

GOAT_NAMESPACE_END
