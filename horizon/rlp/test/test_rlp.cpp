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

#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/int.hpp>
#include <horizon/rlp/address_rlp.hpp>
#include <horizon/rlp/bytes_rlp.hpp>
#include <horizon/rlp/decode.hpp>
#include <horizon/rlp/decode_error.hpp>
#include <horizon/rlp/encode2.hpp>
#include <horizon/rlp/int_rlp.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>
#include <string>

using namespace horizon;
using namespace horizon::rlp;
using namespace evmc::literals;
using namespace intx::literals;

TEST(Rlp, DecodeAfterEncodeString)
{
    {
        std::string const empty_string = "";
        auto encoding = encode_string2(to_byte_string_view(empty_string));
        EXPECT_EQ(encoding, byte_string({0x80}));

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
        EXPECT_EQ(encoding[0], 0xb8);
        EXPECT_EQ(encoding[1], 56);

        byte_string_view encoded_string_view{encoding};
        auto const decoded_string = decode_string(encoded_string_view);
        ASSERT_FALSE(decoded_string.has_error());
        EXPECT_EQ(encoded_string_view.size(), 0);
        EXPECT_EQ(decoded_string.value(), to_byte_string_view(long_string));
    }
}

TEST(Rlp, EncodeUnsigned)
{
    EXPECT_EQ(encode_unsigned(0u), byte_string({0x80}));
    EXPECT_EQ(encode_unsigned(15u), byte_string({0x0f}));
    EXPECT_EQ(encode_unsigned(1024u), byte_string({0x82, 0x04, 0x00}));
    EXPECT_EQ(
        encode_unsigned(uint256_t{0x1c9c380}),
        byte_string({0x84, 0x01, 0xc9, 0xc3, 0x80}));
}

TEST(Rlp, DecodeUnsigned)
{
    byte_string const enc{0x82, 0x04, 0x00};
    byte_string_view view{enc};
    auto const res = decode_unsigned<uint64_t>(view);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 1024);
    EXPECT_TRUE(view.empty());
}

TEST(Rlp, DecodeUnsignedErrors)
{
    {
        byte_string const enc{0x82, 0x00, 0x01};
        byte_string_view view{enc};
        auto const res = decode_unsigned<uint64_t>(view);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::LeadingZero);
    }
    {
        byte_string const enc{0x83, 0x01, 0x02, 0x03};
        byte_string_view view{enc};
        auto const res = decode_unsigned<uint16_t>(view);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::Overflow);
    }
    {
        byte_string const enc{0x83, 0x01, 0x02};
        byte_string_view view{enc};
        auto const res = decode_unsigned<uint64_t>(view);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::InputTooShort);
    }
    {
        byte_string const enc{0xc0};
        byte_string_view view{enc};
        auto const res = decode_unsigned<uint64_t>(view);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::TypeUnexpected);
    }
}

TEST(Rlp, FixedWidthFields)
{
    constexpr auto addr = 0xadca0dd4729c8ba3acf3e99f3a9f471ef37b6825_address;
    constexpr auto hash =
        0x9d63f5e0289258a0566eaf260c79f152c1ddd624735f2698d9eac5106cfe7852_bytes32;

    auto const encoded = encode_list2(encode_address(addr), encode_bytes32(hash));
    byte_string_view view{encoded};
    auto payload = parse_list_metadata(view);
    ASSERT_TRUE(payload.has_value());
    EXPECT_TRUE(view.empty());
    EXPECT_EQ(decode_address(payload.value()).value(), addr);
    EXPECT_EQ(decode_bytes32(payload.value()).value(), hash);
    EXPECT_TRUE(payload.value().empty());

    byte_string const short_enc{0x82, 0x01, 0x02};
    byte_string_view short_view{short_enc};
    auto const res = decode_bytes32(short_view);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::ArrayLengthUnexpected);
}

TEST(Rlp, ListItems)
{
    auto const inner = encode_list2(encode_unsigned(1u), encode_unsigned(2u));
    auto const outer = encode_list2(
        encode_string2(to_byte_string_view(std::string{"dog"})), inner);

    auto const items = decode_list_items(outer);
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items.value().size(), 2);
    EXPECT_EQ(
        items.value()[0], byte_string_view(byte_string{0x83, 'd', 'o', 'g'}));
    EXPECT_EQ(items.value()[1], byte_string_view{inner});

    auto const nested = decode_list_items(items.value()[1]);
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(nested.value().size(), 2);

    byte_string trailing = outer;
    trailing.push_back(0x01);
    auto const res = decode_list_items(trailing);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), DecodeError::InputTooLong);
}

TEST(Rlp, LongList)
{
    std::vector<byte_string> items;
    for (unsigned i = 0; i < 20; ++i) {
        items.push_back(encode_unsigned(uint64_t{1000} + i));
    }
    auto const encoded = encode_list2(items);
    EXPECT_EQ(encoded[0], 0xf8);
    EXPECT_EQ(encoded[1], 60);

    auto const decoded = decode_list_items(encoded);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded.value().size(), 20);
    byte_string_view last = decoded.value().back();
    EXPECT_EQ(decode_unsigned<uint64_t>(last).value(), 1019);
}
