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
#include <horizon/chain/rlp/block_header_rlp.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/int.hpp>
#include <horizon/core/likely.h>
#include <horizon/core/result.hpp>
#include <horizon/rlp/address_rlp.hpp>
#include <horizon/rlp/bytes_rlp.hpp>
#include <horizon/rlp/config.hpp>
#include <horizon/rlp/decode.hpp>
#include <horizon/rlp/decode_error.hpp>
#include <horizon/rlp/encode2.hpp>
#include <horizon/rlp/int_rlp.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

HORIZON_RLP_NAMESPACE_BEGIN

byte_string encode_block_header(BlockHeader const &block_header)
{
    byte_string encoded_block_header;
    encoded_block_header += encode_bytes32(block_header.parent_hash);
    encoded_block_header += encode_bytes32(block_header.ommers_hash);
    encoded_block_header += encode_address(block_header.beneficiary);
    encoded_block_header += encode_bytes32(block_header.state_root);
    encoded_block_header += encode_bytes32(block_header.transactions_root);
    encoded_block_header += encode_bytes32(block_header.receipts_root);
    encoded_block_header +=
        encode_string2(to_byte_string_view(block_header.logs_bloom));
    encoded_block_header += encode_unsigned(block_header.difficulty);
    encoded_block_header += encode_unsigned(block_header.number);
    encoded_block_header += encode_unsigned(block_header.gas_limit);
    encoded_block_header += encode_unsigned(block_header.gas_used);
    encoded_block_header += encode_unsigned(block_header.timestamp);
    encoded_block_header += encode_string2(block_header.extra_data);
    encoded_block_header += encode_bytes32(block_header.prev_randao);
    encoded_block_header +=
        encode_string2(to_byte_string_view(block_header.nonce));

    if (block_header.base_fee_per_gas.has_value()) {
        encoded_block_header +=
            encode_unsigned(block_header.base_fee_per_gas.value());
    }
    if (block_header.withdrawals_root.has_value()) {
        encoded_block_header +=
            encode_bytes32(block_header.withdrawals_root.value());
    }
    if (block_header.blob_gas_used.has_value()) {
        encoded_block_header +=
            encode_unsigned(block_header.blob_gas_used.value());
    }
    if (block_header.excess_blob_gas.has_value()) {
        encoded_block_header +=
            encode_unsigned(block_header.excess_blob_gas.value());
    }
    if (block_header.parent_beacon_block_root.has_value()) {
        encoded_block_header +=
            encode_bytes32(block_header.parent_beacon_block_root.value());
    }
    if (block_header.requests_hash.has_value()) {
        encoded_block_header +=
            encode_bytes32(block_header.requests_hash.value());
    }

    return encode_list2(encoded_block_header);
}

Result<BlockHeader> decode_block_header(byte_string_view &enc)
{
    BlockHeader block_header;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    BOOST_OUTCOME_TRY(block_header.parent_hash, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(block_header.ommers_hash, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(block_header.beneficiary, decode_address(payload));
    BOOST_OUTCOME_TRY(block_header.state_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(block_header.transactions_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(block_header.receipts_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(
        block_header.logs_bloom, decode_byte_string_fixed<256>(payload));
    BOOST_OUTCOME_TRY(
        block_header.difficulty, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(block_header.number, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(
        block_header.gas_limit, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(
        block_header.gas_used, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(
        block_header.timestamp, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(block_header.extra_data, decode_string(payload));
    BOOST_OUTCOME_TRY(block_header.prev_randao, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(block_header.nonce, decode_byte_string_fixed<8>(payload));

    if (payload.size() > 0) {
        BOOST_OUTCOME_TRY(
            block_header.base_fee_per_gas, decode_unsigned<uint256_t>(payload));
    }
    if (payload.size() > 0) {
        BOOST_OUTCOME_TRY(
            block_header.withdrawals_root, decode_bytes32(payload));
    }
    if (payload.size() > 0) {
        BOOST_OUTCOME_TRY(
            block_header.blob_gas_used, decode_unsigned<uint64_t>(payload));
        BOOST_OUTCOME_TRY(
            block_header.excess_blob_gas, decode_unsigned<uint64_t>(payload));
    }
    if (payload.size() > 0) {
        BOOST_OUTCOME_TRY(
            block_header.parent_beacon_block_root, decode_bytes32(payload));
    }
    if (payload.size() > 0) {
        BOOST_OUTCOME_TRY(block_header.requests_hash, decode_bytes32(payload));
    }

    if (HORIZON_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return block_header;
}

HORIZON_RLP_NAMESPACE_END
