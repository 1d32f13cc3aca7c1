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
#include <horizon/core/likely.h>
#include <horizon/core/result.hpp>
#include <horizon/mpt/config.hpp>
#include <horizon/mpt/nibbles.hpp>
#include <horizon/mpt/proof_error.hpp>

HORIZON_MPT_NAMESPACE_BEGIN

// Transform the nibbles to its compact encoding
// https://ethereum.org/en/developers/docs/data-structures-and-encoding/patricia-merkle-trie/
inline byte_string
compact_encode(byte_string_view const nibbles, bool const terminating)
{
    HORIZON_DEBUG_ASSERT(nibbles.size() || terminating);

    byte_string res(nibbles.size() / 2 + 1, 0);
    size_t i = 0;

    // Populate first byte with the encoded nibbles type and potentially
    // also the first nibble if number of nibbles is odd
    res[0] = terminating ? 0x20 : 0x00;
    if (nibbles.size() % 2) {
        res[0] |= static_cast<unsigned char>(0x10 | nibbles[0]);
        i = 1;
    }

    size_t res_ci = 2;
    for (; i < nibbles.size(); i++) {
        set_nibble(res.data(), res_ci++, nibbles[i]);
    }
    return res;
}

struct CompactPath
{
    Nibbles nibbles;
    bool terminating;
};

inline Result<CompactPath> compact_decode(byte_string_view const encoded)
{
    if (HORIZON_UNLIKELY(encoded.empty())) {
        return ProofError::InvalidNode;
    }
    unsigned char const flag = encoded[0] >> 4;
    if (HORIZON_UNLIKELY(flag > 3)) {
        return ProofError::InvalidNode;
    }
    bool const odd = flag & 1;
    if (HORIZON_UNLIKELY(!odd && (encoded[0] & 0xF) != 0)) {
        return ProofError::InvalidNode;
    }

    CompactPath path{.nibbles = {}, .terminating = (flag & 2) != 0};
    Nibbles const all = to_nibbles(encoded);
    path.nibbles = all.substr(odd ? 1 : 2);
    return path;
}

HORIZON_MPT_NAMESPACE_END
