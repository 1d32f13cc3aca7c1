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
#include <horizon/core/result.hpp>
#include <horizon/migration/config.hpp>
#include <horizon/migration/types.hpp>

HORIZON_MIGRATION_NAMESPACE_BEGIN

// Decodes the abi encoded callhook the L1 GNS attaches to a subgraph
// transfer. Trailing data is rejected.
Result<SubgraphMigrationData> decode_callhook_data(byte_string_view);

byte_string encode_callhook_data(SubgraphMigrationData const &);

// Storage slot of subgraphs[subgraph_id].curatorNSignal[curator] in the L1
// GNS
bytes32_t
l1_gns_curator_slot(bytes32_t const &subgraph_id, Address const &curator);

// Address that messages sent by an L1 contract appear to come from on L2
Address apply_l1_to_l2_alias(Address const &);

HORIZON_MIGRATION_NAMESPACE_END
