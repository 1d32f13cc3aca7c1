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
#include <horizon/core/bytes.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/core/likely.h>
#include <horizon/mpt/config.hpp>

HORIZON_MPT_NAMESPACE_BEGIN

// Nodes whose encoding is shorter than a hash are embedded in their parent
inline byte_string to_node_reference(byte_string_view const rlp)
{
    if (HORIZON_LIKELY(rlp.size() >= sizeof(bytes32_t))) {
        auto const hash = keccak256(rlp);
        return byte_string{hash.bytes, sizeof(hash.bytes)};
    }
    return byte_string{rlp};
}

HORIZON_MPT_NAMESPACE_END
