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

#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/config.hpp>
#include <horizon/core/int.hpp>

#include <cstdint>
#include <optional>

HORIZON_NAMESPACE_BEGIN

using Bloom = byte_string_fixed<256>;

// L1 block header. Fields after nonce were appended by later hard forks and
// are present only on blocks produced after the fork activated.
struct BlockHeader
{
    bytes32_t parent_hash{}; // H_p
    bytes32_t ommers_hash{NULL_LIST_HASH}; // H_o
    Address beneficiary{}; // H_c
    bytes32_t state_root{NULL_ROOT}; // H_r
    bytes32_t transactions_root{NULL_ROOT}; // H_t
    bytes32_t receipts_root{NULL_ROOT}; // H_e
    Bloom logs_bloom{}; // H_b
    uint256_t difficulty{}; // H_d
    uint64_t number{0}; // H_i
    uint64_t gas_limit{0}; // H_l
    uint64_t gas_used{0}; // H_g
    uint64_t timestamp{0}; // H_s
    byte_string extra_data{}; // H_x
    bytes32_t prev_randao{}; // H_a
    byte_string_fixed<8> nonce{}; // H_n

    std::optional<uint256_t> base_fee_per_gas{std::nullopt}; // EIP-1559
    std::optional<bytes32_t> withdrawals_root{std::nullopt}; // EIP-4895
    std::optional<uint64_t> blob_gas_used{std::nullopt}; // EIP-4844
    std::optional<uint64_t> excess_blob_gas{std::nullopt}; // EIP-4844
    std::optional<bytes32_t> parent_beacon_block_root{std::nullopt}; // EIP-4788
    std::optional<bytes32_t> requests_hash{std::nullopt}; // EIP-7685

    friend bool operator==(BlockHeader const &, BlockHeader const &) = default;
};

HORIZON_NAMESPACE_END
