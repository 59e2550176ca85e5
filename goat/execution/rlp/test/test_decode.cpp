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
#include <goat/core/int.hpp>
#include <goat/execution/rlp/decode.hpp>
#include <goat/execution/rlp/decode_error.hpp>
#include <goat/execution/rlp/encode.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>
#include <string>

using namespace goat;
using namespace goat::rlp;
using namespace intx::literals;

TEST(Rlp, DecodeAfterEncodeString)
{
    {
        std::string const empty_string = "";
        auto encoding = encode_string2(to_byte_string_view(empty_string));

        byte_string_view encoded_string_view{encoding};
        auto const decoded_string = decode_string(encoded_string_view);
        ASSERT_FALSE(decoded_string.has_error());
        EXPECT_EQ(encoded_string_view.size(), 0);
        EXPECT_EQ(decoded_string.value(), to_byte_string_view(empty_string));
    }

    {
        std::string const long_string =
            "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
        auto encoding = encode_string2(to_byte_string_view(long_string));

        byte_string_view encoded_string_view{encoding};
        auto const decoded_string = decode_string(encoded_string_view);
        ASSERT_FALSE(decoded_string.has_error());
        EXPECT_EQ(encoded_string_view.size(), 0);
        EXPECT_EQ(decoded_string.value(), to_byte_string_view(long_string));
    }
}

TEST(Rlp, DecodeUnsigned)
{
    {
        byte_string const encoding{0x80};
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint8_t>(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), 0);
        EXPECT_TRUE(enc.empty());
    }
    {
        byte_string const encoding{0x7f};
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint8_t>(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), 0x7f);
    }
    {
        auto const encoding = encode_unsigned(uint64_t{0x0102030405});
        EXPECT_EQ(encoding, byte_string({0x85, 0x01, 0x02, 0x03, 0x04, 0x05}));
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint64_t>(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), 0x0102030405u);
    }
    {
        auto const encoding = encode_unsigned(0xc64ab11e_u256);
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint256_t>(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), 0xc64ab11e_u256);
    }
}

TEST(Rlp, DecodeUnsignedErrors)
{
    {
        byte_string const encoding{0x82, 0x00, 0x01};
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint64_t>(enc);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), DecodeError::LeadingZero);
    }
    {
        byte_string const encoding{0x82, 0x01, 0x00};
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint8_t>(enc);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), DecodeError::Overflow);
    }
    {
        byte_string const encoding{0x83, 0x01, 0x02};
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint64_t>(enc);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), DecodeError::InputTooShort);
    }
    {
        byte_string const encoding{0xc1, 0x01};
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint64_t>(enc);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), DecodeError::TypeUnexpected);
    }
    {
        byte_string_view enc{};
        auto const decoded = decode_unsigned<uint64_t>(enc);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), DecodeError::InputTooShort);
    }
}

TEST(Rlp, ParseListMetadata)
{
    {
        auto const encoding = encode_list2(
            encode_string2(to_byte_string_view("cat")),
            encode_string2(to_byte_string_view("dog")));
        byte_string_view enc{encoding};
        auto payload = parse_list_metadata(enc);
        ASSERT_FALSE(payload.has_error());
        EXPECT_TRUE(enc.empty());
        EXPECT_EQ(payload.value().size(), 8);

        auto const cat = decode_string(payload.value());
        ASSERT_FALSE(cat.has_error());
        EXPECT_EQ(cat.value(), to_byte_string_view(std::string{"cat"}));
        auto const dog = decode_string(payload.value());
        ASSERT_FALSE(dog.has_error());
        EXPECT_EQ(dog.value(), to_byte_string_view(std::string{"dog"}));
        EXPECT_TRUE(payload.value().empty());
    }
    {
        byte_string const encoding{0x83, 'd', 'o', 'g'};
        byte_string_view enc{encoding};
        auto const payload = parse_list_metadata(enc);
        ASSERT_TRUE(payload.has_error());
        EXPECT_EQ(payload.assume_error(), DecodeError::TypeUnexpected);
    }
    {
        byte_string const encoding{0xc3, 0x01, 0x02};
        byte_string_view enc{encoding};
        auto const payload = parse_list_metadata(enc);
        ASSERT_TRUE(payload.has_error());
        EXPECT_EQ(payload.assume_error(), DecodeError::InputTooShort);
    }
    {
        byte_string const long_payload(60, 0x01);
        auto const encoding = encode_list2(long_payload);
        ASSERT_EQ(encoding.substr(0, 2), byte_string({0xf8, 60}));
        byte_string_view enc{encoding};
        auto const payload = parse_list_metadata(enc);
        ASSERT_FALSE(payload.has_error());
        EXPECT_EQ(payload.value(), byte_string_view{long_payload});
    }
}

TEST(Rlp, RejectNonCanonical)
{
    {
        byte_string const encoding{0x81, 0x01};
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint8_t>(enc);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), DecodeError::NonCanonical);
    }
    {
        byte_string const encoding{0x81, 0x80};
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint8_t>(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), 0x80);
    }
    {
        byte_string const encoding{0xb8, 0x03, 'd', 'o', 'g'};
        byte_string_view enc{encoding};
        auto const decoded = decode_string(enc);
        ASSERT_TRUE(decoded.has_error());
        EXPECT_EQ(decoded.assume_error(), DecodeError::NonCanonical);
    }
    {
        byte_string encoding{0xf8, 55};
        encoding += byte_string(55, 0x01);
        byte_string_view enc{encoding};
        auto const payload = parse_list_metadata(enc);
        ASSERT_TRUE(payload.has_error());
        EXPECT_EQ(payload.assume_error(), DecodeError::NonCanonical);
    }
}
