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
#include <horizon/core/bytes.hpp>
#include <horizon/core/int.hpp>
#include <horizon/migration/config.hpp>

#include <cstdint>

HORIZON_MIGRATION_NAMESPACE_BEGIN

struct MigrationStore;

void emit_subgraph_received_from_l1_event(
    MigrationStore &, bytes32_t const &subgraph_id, Address const &owner,
    uint256_t const &tokens);
void emit_subgraph_metadata_updated_event(
    MigrationStore &, bytes32_t const &subgraph_id, bytes32_t const &metadata);
void emit_subgraph_published_event(
    MigrationStore &, bytes32_t const &subgraph_id,
    bytes32_t const &deployment_id, uint32_t reserve_ratio);
void emit_subgraph_migration_finalized_event(
    MigrationStore &, bytes32_t const &subgraph_id);
void emit_curator_balance_claimed_event(
    MigrationStore &, bytes32_t const &subgraph_id, Address const &l1_curator,
    Address const &l2_curator, uint256_t const &n_signal);
void emit_counterpart_gns_address_updated_event(
    MigrationStore &, Address const &counterpart);

HORIZON_MIGRATION_NAMESPACE_END
