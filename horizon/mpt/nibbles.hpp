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

#include <horizon/core/byte_string.hpp>
#include <horizon/mpt/config.hpp>

HORIZON_MPT_NAMESPACE_BEGIN

// One nibble (0x0 - 0xf) per element
using Nibbles = byte_string;

inline unsigned char get_nibble(unsigned char const *const d, size_t const n)
{
    unsigned char r = d[n / 2];
    if (n % 2 == 0) {
        r >>= 4;
    }
    else {
        r &= 0xF;
    }
    return r;
}

inline void
set_nibble(unsigned char *const d, size_t const n, unsigned char const v)
{
    unsigned char r = d[n / 2];
    if (n % 2 == 0) {
        r &= 0xF;
        r |= static_cast<unsigned char>(v << 4);
    }
    else {
        r &= 0xF0;
        r |= (v & 0xF);
    }
    d[n / 2] = r;
}

inline Nibbles to_nibbles(byte_string_view const bytes)
{
    Nibbles nibbles(bytes.size() * 2, 0);
    for (size_t i = 0; i < nibbles.size(); ++i) {
        nibbles[i] = get_nibble(bytes.data(), i);
    }
    return nibbles;
}

HORIZON_MPT_NAMESPACE_END
