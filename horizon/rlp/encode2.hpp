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

#include <horizon/core/assert.h>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/int.hpp>
#include <horizon/rlp/config.hpp>

#include <concepts>
#include <cstdint>
#include <vector>

HORIZON_RLP_NAMESPACE_BEGIN

inline byte_string_view zeroless_view(byte_string_view const string_view)
{
    auto b = string_view.begin();
    auto const e = string_view.end();
    while (b < e && *b == 0) {
        ++b;
    }
    return {b, e};
}

inline byte_string to_big_compact(unsigned_integral auto n)
{
    n = intx::to_big_endian(n);
    return byte_string(
        zeroless_view({reinterpret_cast<unsigned char *>(&n), sizeof(n)}));
}

inline byte_string encode_string2(byte_string_view const string_view)
{
    byte_string result;
    uint32_t const size = static_cast<uint32_t>(string_view.size());
    if (size == 1 && string_view[0] <= 0x7f) {
        result = string_view;
    }
    else if (size > 55) {
        auto const size_str = to_big_compact(size);
        HORIZON_ASSERT(size_str.size() <= 8u);
        result.push_back(0xb7 + static_cast<unsigned char>(size_str.size()));
        result += size_str;
        result += string_view;
    }
    else {
        result.push_back(0x80 + static_cast<unsigned char>(size));
        result += string_view;
    }
    return result;
}

inline byte_string wrap_list(byte_string_view const payload)
{
    byte_string result;
    size_t const size = payload.size();
    if (size > 55) {
        auto const size_str = to_big_compact(size);
        HORIZON_ASSERT(size_str.size() <= 8u);
        result += (0xf7 + static_cast<unsigned char>(size_str.size()));
        result += size_str;
    }
    else {
        result += (0xc0 + static_cast<unsigned char>(size));
    }
    result += payload;
    return result;
}

template <std::convertible_to<byte_string>... Args>
byte_string encode_list2(Args const &...args)
{
    byte_string payload;
    ([&] { payload += args; }(), ...);
    return wrap_list(payload);
}

// Each element must already be an rlp encoded item
inline byte_string encode_list2(std::vector<byte_string> const &items)
{
    byte_string payload;
    for (auto const &item : items) {
        payload += item;
    }
    return wrap_list(payload);
}

HORIZON_RLP_NAMESPACE_END
