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

#include <horizon/chain/account.hpp>
#include <horizon/chain/rlp/account_rlp.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/core/likely.h>
#include <horizon/core/result.hpp>
#include <horizon/mpt/compact_encode.hpp>
#include <horizon/mpt/config.hpp>
#include <horizon/mpt/nibbles.hpp>
#include <horizon/mpt/node_reference.hpp>
#include <horizon/mpt/proof.hpp>
#include <horizon/mpt/proof_error.hpp>
#include <horizon/rlp/decode.hpp>
#include <horizon/rlp/decode_error.hpp>
#include <horizon/rlp/int_rlp.hpp>

#include <boost/outcome/try.hpp>

#include <span>

HORIZON_MPT_NAMESPACE_BEGIN

namespace
{
    // A child slot is either the hash of the child or, when the child
    // encodes to less than 32 bytes, the child itself
    struct ChildReference
    {
        byte_string reference;
        bool embedded;
    };

    Result<ChildReference> parse_child(byte_string_view const item)
    {
        if (item[0] >= 0xc0) {
            return ChildReference{
                .reference = byte_string{item}, .embedded = true};
        }
        byte_string_view enc = item;
        BOOST_OUTCOME_TRY(auto const hash, rlp::decode_string(enc));
        if (hash.empty()) {
            return ProofError::KeyNotFound;
        }
        if (HORIZON_UNLIKELY(hash.size() != sizeof(bytes32_t))) {
            return ProofError::InvalidNode;
        }
        return ChildReference{
            .reference = byte_string{hash}, .embedded = false};
    }

    Result<byte_string> decode_value(byte_string_view enc)
    {
        BOOST_OUTCOME_TRY(auto const value, rlp::decode_string(enc));
        if (value.empty()) {
            return ProofError::KeyNotFound;
        }
        return byte_string{value};
    }
}

Result<byte_string> verify_proof(
    bytes32_t const &root, byte_string_view const path,
    std::span<byte_string const> const proof)
{
    if (HORIZON_UNLIKELY(proof.empty())) {
        if (root == NULL_ROOT) {
            return ProofError::KeyNotFound;
        }
        return ProofError::InvalidRootHash;
    }

    Nibbles const key = to_nibbles(path);
    size_t pos = 0;
    size_t next = 0;
    ChildReference child{
        .reference = byte_string{root.bytes, sizeof(root.bytes)},
        .embedded = false};
    byte_string node;

    while (true) {
        if (child.embedded) {
            node = child.reference;
            // eth_getProof omits embedded nodes but some provers list them
            if (next < proof.size() && proof[next] == node) {
                ++next;
            }
        }
        else {
            if (next == proof.size()) {
                return ProofError::KeyNotFound;
            }
            node = proof[next];
            if (next == 0) {
                if (HORIZON_UNLIKELY(to_bytes(keccak256(node)) != root)) {
                    return ProofError::InvalidRootHash;
                }
            }
            else if (HORIZON_UNLIKELY(
                         to_node_reference(node) != child.reference)) {
                return ProofError::InvalidNodeHash;
            }
            ++next;
        }

        BOOST_OUTCOME_TRY(auto const items, rlp::decode_list_items(node));

        if (items.size() == BRANCH_ITEMS) {
            if (pos == key.size()) {
                if (HORIZON_UNLIKELY(next != proof.size())) {
                    return ProofError::InvalidNode;
                }
                return decode_value(items[BRANCH_ITEMS - 1]);
            }
            BOOST_OUTCOME_TRY(child, parse_child(items[key[pos]]));
            ++pos;
        }
        else if (items.size() == SHORT_NODE_ITEMS) {
            byte_string_view enc = items[0];
            BOOST_OUTCOME_TRY(auto const encoded_path, rlp::decode_string(enc));
            BOOST_OUTCOME_TRY(auto const partial, compact_decode(encoded_path));
            size_t const len = partial.nibbles.size();
            if (HORIZON_UNLIKELY(key.substr(pos, len) != partial.nibbles)) {
                return ProofError::InvalidNodeHash;
            }
            pos += len;
            if (partial.terminating) {
                if (pos != key.size()) {
                    return ProofError::KeyNotFound;
                }
                if (HORIZON_UNLIKELY(next != proof.size())) {
                    return ProofError::InvalidNode;
                }
                return decode_value(items[1]);
            }
            BOOST_OUTCOME_TRY(child, parse_child(items[1]));
        }
        else {
            return ProofError::InvalidNode;
        }
    }
}

Result<Account> get_account(
    bytes32_t const &state_root, Address const &address,
    std::span<byte_string const> const account_proof)
{
    auto const key = keccak256(to_byte_string_view(address.bytes));
    BOOST_OUTCOME_TRY(
        auto const value,
        verify_proof(
            state_root, to_byte_string_view(key.bytes), account_proof));
    byte_string_view enc{value};
    BOOST_OUTCOME_TRY(auto const account, rlp::decode_account(enc));
    if (HORIZON_UNLIKELY(!enc.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    return account;
}

Result<bytes32_t> get_account_storage_root(
    bytes32_t const &state_root, Address const &address,
    std::span<byte_string const> const account_proof)
{
    BOOST_OUTCOME_TRY(
        auto const account, get_account(state_root, address, account_proof));
    return account.storage_root;
}

Result<uint256_t> get_storage_value(
    bytes32_t const &storage_root, bytes32_t const &slot,
    std::span<byte_string const> const storage_proof)
{
    auto const key = keccak256(to_byte_string_view(slot.bytes));
    BOOST_OUTCOME_TRY(
        auto const value,
        verify_proof(
            storage_root, to_byte_string_view(key.bytes), storage_proof));
    byte_string_view enc{value};
    BOOST_OUTCOME_TRY(auto const n, rlp::decode_unsigned<uint256_t>(enc));
    if (HORIZON_UNLIKELY(!enc.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    return n;
}

HORIZON_MPT_NAMESPACE_END
