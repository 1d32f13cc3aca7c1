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
#include <horizon/core/contract/abi_decode_error.hpp>
#include <horizon/core/int.hpp>
#include <horizon/core/likely.h>
#include <horizon/core/result.hpp>

#include <concepts>
#include <cstdint>
#include <cstring>

HORIZON_NAMESPACE_BEGIN

// Every static solidity type occupies one 32 byte word of the head. Addresses
// and narrow uints are left padded. Dirty high order bits are ignored, which
// matches solidity's own decoder since 0.5.0.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html
template <typename T>
    requires(
        std::same_as<T, Address> || std::same_as<T, bytes32_t> ||
        std::same_as<T, uint256_t> || std::same_as<T, uint32_t>)
Result<T> abi_decode_fixed(byte_string_view &enc)
{
    if (HORIZON_UNLIKELY(enc.size() < 32)) {
        return AbiDecodeError::InputTooShort;
    }

    T output{};
    if constexpr (std::same_as<T, uint256_t>) {
        output = intx::be::unsafe::load<uint256_t>(enc.data());
    }
    else if constexpr (std::same_as<T, uint32_t>) {
        output = intx::be::unsafe::load<uint32_t>(enc.data() + 28);
    }
    else {
        constexpr size_t offset = 32 - sizeof(T);
        std::memcpy(&output, enc.data() + offset, sizeof(T));
    }
    enc.remove_prefix(32);
    return output;
}

HORIZON_NAMESPACE_END
