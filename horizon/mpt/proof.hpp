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

#include <horizon/chain/account.hpp>
#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/int.hpp>
#include <horizon/core/result.hpp>
#include <horizon/mpt/config.hpp>

#include <span>

HORIZON_MPT_NAMESPACE_BEGIN

// Walks an inclusion proof from the root down and returns the value stored
// at path. proof holds the rlp encoded nodes in root to leaf order, as
// returned by eth_getProof. path is used as is; secure tries hash their keys
// before calling this.
//
// A mismatch of the first node against root is reported as InvalidRootHash,
// any later hash or path mismatch as InvalidNodeHash. Only membership proofs
// are supported: an empty slot or a proof that ends early is KeyNotFound.
Result<byte_string> verify_proof(
    bytes32_t const &root, byte_string_view path,
    std::span<byte_string const> proof);

// Proves the account at address against a state root
Result<Account> get_account(
    bytes32_t const &state_root, Address const &address,
    std::span<byte_string const> account_proof);

Result<bytes32_t> get_account_storage_root(
    bytes32_t const &state_root, Address const &address,
    std::span<byte_string const> account_proof);

// Proves the value of a storage slot against an account storage root
Result<uint256_t> get_storage_value(
    bytes32_t const &storage_root, bytes32_t const &slot,
    std::span<byte_string const> storage_proof);

HORIZON_MPT_NAMESPACE_END
