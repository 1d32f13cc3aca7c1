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

#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/config.hpp>
#include <horizon/core/int.hpp>

#include <cstdint>
#include <cstring>

HORIZON_NAMESPACE_BEGIN

// Helpers for encoding static types into the solidity ABI, used for event
// data and for the bridge callhook payload.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
inline bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(&output.bytes[12], address.bytes, sizeof(Address));
    return output;
}

inline bytes32_t abi_encode_uint(uint256_t const &i)
{
    return intx::be::store<bytes32_t>(i);
}

inline bytes32_t abi_encode_bool(bool const b)
{
    return abi_encode_uint(b ? 1 : 0);
}

// Encodes a tuple of static types. Every member lands in the head.
class AbiEncoder
{
    byte_string head_;

    void add_static(bytes32_t const &data)
    {
        head_ += byte_string_view{data.bytes, sizeof(bytes32_t)};
    }

public:
    void add_address(Address const &address)
    {
        add_static(abi_encode_address(address));
    }

    void add_uint(uint256_t const &i)
    {
        add_static(abi_encode_uint(i));
    }

    void add_bytes32(bytes32_t const &b)
    {
        add_static(b);
    }

    void add_bool(bool const b)
    {
        add_static(abi_encode_bool(b));
    }

    byte_string encode_final()
    {
        return std::move(head_);
    }
};

HORIZON_NAMESPACE_END
