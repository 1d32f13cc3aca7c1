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
#include <horizon/core/contract/events.hpp>
#include <horizon/core/int.hpp>
#include <horizon/migration/config.hpp>

#include <cstdint>
#include <map>
#include <set>
#include <vector>

HORIZON_MIGRATION_NAMESPACE_BEGIN

// State of a subgraph received from L1. l1_done and deprecated only have
// meaning on L1 and are fixed on this side.
struct MigrationRecord
{
    uint256_t tokens{0};
    bytes32_t locked_at_block_hash{};
    bool l1_done{true};
    bool l2_done{false};
    bool deprecated{false};
    // L1 curators whose balance has been claimed
    std::set<Address> claimed{};
};

struct Subgraph
{
    uint256_t n_signal{0};
    uint256_t v_signal{0};
    bytes32_t deployment_id{};
    uint32_t reserve_ratio{0};
    bool disabled{false};
    Address owner{};
    bytes32_t metadata{};
    std::map<Address, uint256_t> curator_signal{};
};

// Decoded bridge callhook payload
struct SubgraphMigrationData
{
    bytes32_t subgraph_id{};
    Address owner{};
    bytes32_t lock_block_hash{};
    uint256_t n_signal{0};
    uint32_t reserve_ratio{0};
    bytes32_t metadata{};
};

struct MigrationParams
{
    Address gateway{};
    Address governor{};
    uint64_t chain_id{0};
};

struct MigrationStore
{
    Address counterpart{};

    std::map<bytes32_t, MigrationRecord> migrations{};
    std::map<bytes32_t, Subgraph> subgraphs{};
    std::map<Address, uint64_t> next_sequence{};

    // tokens received from the bridge and deposited into curation
    uint256_t tokens_received{0};
    uint256_t tokens_curated{0};

    std::vector<LogEntry> events{};

    void emit_log(LogEntry const &event)
    {
        events.push_back(event);
    }
};

HORIZON_MIGRATION_NAMESPACE_END
