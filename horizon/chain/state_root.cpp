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

#include <horizon/chain/block_header.hpp>
#include <horizon/chain/header_error.hpp>
#include <horizon/chain/rlp/block_header_rlp.hpp>
#include <horizon/chain/state_root.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/fmt/bytes_fmt.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/core/likely.h>
#include <horizon/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

HORIZON_CHAIN_NAMESPACE_BEGIN

Result<bytes32_t> decode_verified_state_root(
    byte_string_view const header_rlp, bytes32_t const &expected_block_hash)
{
    byte_string_view enc = header_rlp;
    BOOST_OUTCOME_TRY(auto const header, rlp::decode_block_header(enc));
    if (HORIZON_UNLIKELY(!enc.empty())) {
        return rlp::DecodeError::InputTooLong;
    }

    bytes32_t const block_hash = to_bytes(keccak256(header_rlp));
    if (HORIZON_UNLIKELY(block_hash != expected_block_hash)) {
        LOG_DEBUG(
            "header hash {} does not match expected {}",
            block_hash,
            expected_block_hash);
        return HeaderError::BlockHashMismatch;
    }

    return header.state_root;
}

HORIZON_CHAIN_NAMESPACE_END
