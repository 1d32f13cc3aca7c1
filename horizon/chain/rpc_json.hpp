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

#include <horizon/chain/block_header.hpp>
#include <horizon/chain/config.hpp>
#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/int.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

HORIZON_CHAIN_NAMESPACE_BEGIN

struct StorageProof
{
    bytes32_t key{};
    uint256_t value{};
    std::vector<byte_string> proof{};
};

// Result object of eth_getProof
struct AccountProof
{
    Address address{};
    uint64_t nonce{0};
    uint256_t balance{0};
    bytes32_t storage_hash{NULL_ROOT};
    bytes32_t code_hash{NULL_HASH};
    std::vector<byte_string> account_proof{};
    std::vector<StorageProof> storage_proof{};
};

// Parsers for JSON-RPC results. Malformed input throws.
BlockHeader block_header_from_json(nlohmann::json const &);
AccountProof account_proof_from_json(nlohmann::json const &);

byte_string bytes_from_hex(std::string_view);

HORIZON_CHAIN_NAMESPACE_END
