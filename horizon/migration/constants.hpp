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
#include <horizon/core/int.hpp>
#include <horizon/migration/config.hpp>

#include <cstddef>
#include <cstdint>

#include <intx/intx.hpp>

HORIZON_MIGRATION_NAMESPACE_BEGIN

using namespace intx::literals;

inline constexpr Address GNS_CA{0x1002};

// Added to an L1 contract address to get the sender seen on L2 for messages
// it sends through the bridge
inline constexpr uint256_t L1_TO_L2_ALIAS_OFFSET{
    0x1111000000000000000000000000000000001111_u256};

// Storage layout of the L1 GNS. subgraphs is a mapping at slot 18 of
// structs whose curatorNSignal mapping sits at offset 2.
inline constexpr uint64_t L1_GNS_SUBGRAPHS_SLOT{18};
inline constexpr uint64_t L1_GNS_CURATOR_NSIGNAL_OFFSET{2};

inline constexpr uint32_t DEFAULT_RESERVE_RATIO{1'000'000};

// uint256 subgraphId, address owner, bytes32 lockBlockHash, uint256 nSignal,
// uint32 reserveRatio, bytes32 metadata
inline constexpr size_t CALLHOOK_DATA_SIZE{6 * 32};

HORIZON_MIGRATION_NAMESPACE_END
