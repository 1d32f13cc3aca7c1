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
#include <horizon/core/contract/abi_decode.hpp>
#include <horizon/core/contract/abi_decode_error.hpp>
#include <horizon/core/contract/abi_encode.hpp>
#include <horizon/core/contract/abi_signatures.hpp>
#include <horizon/core/contract/events.hpp>
#include <horizon/core/int.hpp>
#include <horizon/core/keccak.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>
#include <string_view>

using namespace horizon;
using namespace intx::literals;
using namespace evmc::literals;

TEST(AbiDecode, static_tuple)
{
    constexpr auto owner = 0xe99bd186dbda4dc0a499b158e9e8ea7a628edd14_address;
    constexpr auto hash =
        0x82e59e8ef5e6c4352d363fc5b6ea64d6f605d47ff0c454ea1133be6bacaff487_bytes32;

    AbiEncoder encoder;
    encoder.add_uint(1337);
    encoder.add_address(owner);
    encoder.add_bytes32(hash);
    encoder.add_uint(1000000);
    byte_string const encoded = encoder.encode_final();
    ASSERT_EQ(encoded.size(), 128);

    byte_string_view input{encoded};
    EXPECT_EQ(abi_decode_fixed<uint256_t>(input).value(), 1337);
    EXPECT_EQ(abi_decode_fixed<Address>(input).value(), owner);
    EXPECT_EQ(abi_decode_fixed<bytes32_t>(input).value(), hash);
    EXPECT_EQ(abi_decode_fixed<uint32_t>(input).value(), 1000000u);
    EXPECT_TRUE(input.empty());
}

TEST(AbiDecode, input_too_short)
{
    bytes32_t const encoded = abi_encode_uint(255);
    byte_string_view input{encoded.bytes, 31};
    auto const res = abi_decode_fixed<uint256_t>(input);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), AbiDecodeError::InputTooShort);
    EXPECT_EQ(input.size(), 31);
}

TEST(AbiDecode, uint32_higher_bits_ignored)
{
    bytes32_t const encoded = abi_encode_uint(UINT256_MAX);
    byte_string_view input{encoded.bytes, sizeof(encoded)};
    EXPECT_EQ(abi_decode_fixed<uint32_t>(input).value(), UINT32_MAX);
}

TEST(AbiSignature, matches_runtime_keccak)
{
    constexpr std::string_view sig = "Transfer(address,address,uint256)";
    constexpr bytes32_t expected = abi_encode_event_signature(sig);
    EXPECT_EQ(
        expected,
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32);
    EXPECT_EQ(
        to_bytes(keccak256(byte_string_view{
            reinterpret_cast<unsigned char const *>(sig.data()), sig.size()})),
        expected);
}

TEST(EventBuilder, topics_and_data)
{
    constexpr auto account = 0x00000000000000000000000000000000000000ff_address;
    constexpr bytes32_t signature = abi_encode_event_signature("Foo(uint256)");
    auto const log = EventBuilder(account, signature)
                         .add_topic(abi_encode_address(account))
                         .add_data(abi_encode_uint(7))
                         .build();
    EXPECT_EQ(log.address, account);
    ASSERT_EQ(log.topics.size(), 2);
    EXPECT_EQ(log.topics[0], signature);
    ASSERT_EQ(log.data.size(), 32);
    EXPECT_EQ(log.data[31], 7);
}
