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
#include <goat/core/int.hpp>
#include <goat/execution/core/address.hpp>
#include <goat/execution/core/contract/abi_encode.hpp>
#include <goat/execution/core/contract/big_endian.hpp>
#include <goat/execution/goat/calldata.hpp>
#include <goat/execution/goat/goat_error.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <limits>

using namespace goat;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    constexpr uint32_t TEST_SELECTOR = 0xdeadbeef;
}

TEST(CalldataReader, reads_in_order)
{
    auto const input = encode_calldata(
        TEST_SELECTOR,
        {abi_encode_uint(u256_be{0x1234_u256}),
         abi_encode_address(0x00000000000000000000000000000000000000aa_address),
         abi_encode_uint(u64_be{uint64_t{42}}),
         abi_encode_uint(u32_be{uint32_t{7}}),
         0x0101010101010101010101010101010101010101010101010101010101010101_bytes32});
    ASSERT_EQ(input.size(), 4u + 5u * 32u);
    EXPECT_EQ(input.substr(0, 4), (byte_string{0xde, 0xad, 0xbe, 0xef}));

    auto res = CalldataReader::open(input, input.size(), TEST_SELECTOR, "test");
    ASSERT_FALSE(res.has_error());
    auto &reader = res.value();
    EXPECT_EQ(reader.remaining(), 5u * 32u);

    auto const a = reader.read_uint256();
    ASSERT_FALSE(a.has_error());
    EXPECT_EQ(a.value(), 0x1234_u256);

    auto const b = reader.read_address();
    ASSERT_FALSE(b.has_error());
    EXPECT_EQ(b.value(), 0x00000000000000000000000000000000000000aa_address);

    auto const c = reader.read_uint64();
    ASSERT_FALSE(c.has_error());
    EXPECT_EQ(c.value(), 42u);

    auto const d = reader.read_uint32();
    ASSERT_FALSE(d.has_error());
    EXPECT_EQ(d.value(), 7u);

    auto const e = reader.read_bytes32();
    ASSERT_FALSE(e.has_error());
    EXPECT_EQ(
        e.value(),
        0x0101010101010101010101010101010101010101010101010101010101010101_bytes32);
    EXPECT_EQ(reader.remaining(), 0u);

    auto const f = reader.read_uint256();
    ASSERT_TRUE(f.has_error());
    EXPECT_EQ(f.assume_error(), GoatTxError::MalformedField);
}

TEST(CalldataReader, length_mismatch)
{
    auto const input =
        encode_calldata(TEST_SELECTOR, {abi_encode_uint(u256_be{1})});
    auto const res = CalldataReader::open(input, 68, TEST_SELECTOR, "test");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GoatTxError::LengthMismatch);
    EXPECT_STREQ(
        res.assume_error().message().c_str(), "payload length mismatch");

    auto const sizes = length_mismatch_sizes(res.assume_error());
    ASSERT_TRUE(sizes.has_value());
    EXPECT_EQ(sizes->expected, 68u);
    EXPECT_EQ(sizes->actual, 36u);
}

TEST(CalldataReader, sizes_only_on_length_mismatch)
{
    auto const input =
        encode_calldata(TEST_SELECTOR, {abi_encode_uint(u256_be{1})});
    auto const res = CalldataReader::open(input, 36, 0xdeadbeee, "test");
    ASSERT_TRUE(res.has_error());
    EXPECT_FALSE(length_mismatch_sizes(res.assume_error()).has_value());
}

TEST(CalldataReader, selector_mismatch)
{
    auto const input =
        encode_calldata(TEST_SELECTOR, {abi_encode_uint(u256_be{1})});
    auto const res = CalldataReader::open(input, 36, 0xdeadbeee, "test");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GoatTxError::SelectorMismatch);
}

TEST(CalldataReader, shorter_than_selector)
{
    byte_string const input{0xde, 0xad};
    auto const res = CalldataReader::open(input, 2, TEST_SELECTOR, "test");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), GoatTxError::MalformedField);
}

TEST(CalldataReader, narrow_reads_ignore_high_bytes)
{
    bytes32_t word{};
    for (auto &b : word.bytes) {
        b = 0xff;
    }
    auto const input = encode_calldata(TEST_SELECTOR, {word, word, word});
    auto res = CalldataReader::open(input, 100, TEST_SELECTOR, "test");
    ASSERT_FALSE(res.has_error());
    auto &reader = res.value();

    auto const address = reader.read_address();
    ASSERT_FALSE(address.has_error());
    EXPECT_EQ(address.value(), 0xffffffffffffffffffffffffffffffffffffffff_address);

    auto const u64 = reader.read_uint64();
    ASSERT_FALSE(u64.has_error());
    EXPECT_EQ(u64.value(), std::numeric_limits<uint64_t>::max());

    auto const u32 = reader.read_uint32();
    ASSERT_FALSE(u32.has_error());
    EXPECT_EQ(u32.value(), std::numeric_limits<uint32_t>::max());
}
