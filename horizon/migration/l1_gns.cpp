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
#include <horizon/core/int.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/core/likely.h>
#include <horizon/migration/constants.hpp>
#include <horizon/migration/l1_gns.hpp>
#include <horizon/migration/types.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <cstring>

HORIZON_MIGRATION_NAMESPACE_BEGIN

Result<SubgraphMigrationData> decode_callhook_data(byte_string_view enc)
{
    SubgraphMigrationData data;
    BOOST_OUTCOME_TRY(data.subgraph_id, abi_decode_fixed<bytes32_t>(enc));
    BOOST_OUTCOME_TRY(data.owner, abi_decode_fixed<Address>(enc));
    BOOST_OUTCOME_TRY(data.lock_block_hash, abi_decode_fixed<bytes32_t>(enc));
    BOOST_OUTCOME_TRY(data.n_signal, abi_decode_fixed<uint256_t>(enc));
    BOOST_OUTCOME_TRY(data.reserve_ratio, abi_decode_fixed<uint32_t>(enc));
    BOOST_OUTCOME_TRY(data.metadata, abi_decode_fixed<bytes32_t>(enc));
    if (HORIZON_UNLIKELY(!enc.empty())) {
        return AbiDecodeError::InputTooLong;
    }
    return data;
}

byte_string encode_callhook_data(SubgraphMigrationData const &data)
{
    AbiEncoder encoder;
    encoder.add_bytes32(data.subgraph_id);
    encoder.add_address(data.owner);
    encoder.add_bytes32(data.lock_block_hash);
    encoder.add_uint(data.n_signal);
    encoder.add_uint(data.reserve_ratio);
    encoder.add_bytes32(data.metadata);
    return encoder.encode_final();
}

bytes32_t
l1_gns_curator_slot(bytes32_t const &subgraph_id, Address const &curator)
{
    byte_string subgraph_key;
    subgraph_key += to_byte_string_view(subgraph_id.bytes);
    subgraph_key +=
        to_byte_string_view(abi_encode_uint(L1_GNS_SUBGRAPHS_SLOT).bytes);
    uint256_t const subgraph_slot =
        to_uint256(to_bytes(keccak256(subgraph_key)));

    byte_string curator_key;
    curator_key += to_byte_string_view(abi_encode_address(curator).bytes);
    curator_key += to_byte_string_view(
        abi_encode_uint(
            subgraph_slot + uint256_t{L1_GNS_CURATOR_NSIGNAL_OFFSET})
            .bytes);
    return to_bytes(keccak256(curator_key));
}

Address apply_l1_to_l2_alias(Address const &l1_address)
{
    uint256_t const aliased =
        (to_uint256(abi_encode_address(l1_address)) + L1_TO_L2_ALIAS_OFFSET) &
        ((uint256_t{1} << 160) - 1);
    bytes32_t const word = to_bytes(aliased);
    Address out;
    std::memcpy(out.bytes, &word.bytes[12], sizeof(Address));
    return out;
}

HORIZON_MIGRATION_NAMESPACE_END
