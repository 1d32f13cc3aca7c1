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

#include <horizon/chain/config.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/result.hpp>

HORIZON_CHAIN_NAMESPACE_BEGIN

// Decodes an rlp block header, checks that it hashes to expected_block_hash
// and returns its state root. Nothing else in the header is validated.
Result<bytes32_t> decode_verified_state_root(
    byte_string_view header_rlp, bytes32_t const &expected_block_hash);

HORIZON_CHAIN_NAMESPACE_END
