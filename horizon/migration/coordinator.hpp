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
#include <horizon/core/int.hpp>
#include <horizon/core/result.hpp>
#include <horizon/migration/config.hpp>
#include <horizon/migration/types.hpp>

#include <optional>

HORIZON_MIGRATION_NAMESPACE_BEGIN

class Curation;

// L2 side of subgraph migration. Subgraphs arrive disabled through the token
// bridge and are published by their owner. L1 curators then claim their
// signal either with a storage proof against the block the subgraph was
// locked at, or through a message relayed from the L1 GNS.
class MigrationCoordinator
{
    MigrationStore &store_;
    Curation &curation_;
    MigrationParams params_;

    Result<MigrationRecord *> finalized_record(bytes32_t const &subgraph_id);

    void credit_signal(
        bytes32_t const &subgraph_id, MigrationRecord &,
        Address const &l1_curator, Address const &beneficiary,
        uint256_t const &n_signal);

public:
    MigrationCoordinator(MigrationStore &, Curation &, MigrationParams const &);

    // Bridge callback. caller is the account invoking the hook, from the L1
    // sender of the deposit.
    Result<void> on_token_transfer(
        Address const &caller, Address const &from, uint256_t const &amount,
        byte_string_view callhook_data);

    Result<void> finish_migration(
        Address const &caller, bytes32_t const &subgraph_id,
        bytes32_t const &deployment_id, bytes32_t const &metadata);

    // Credits the caller with the signal it held on L1 at the block the
    // subgraph was locked at
    Result<uint256_t> claim_l1_curator_balance(
        Address const &caller, bytes32_t const &subgraph_id,
        byte_string_view header_rlp, byte_string_view proof_rlp);

    Result<void> claim_l1_curator_balance_to_beneficiary(
        Address const &caller, bytes32_t const &subgraph_id,
        Address const &l1_curator, uint256_t const &n_signal,
        Address const &beneficiary);

    Result<void>
    set_counterpart_address(Address const &caller, Address const &counterpart);

    // Publishes a subgraph created on L2. Such subgraphs are never
    // claimable.
    Result<bytes32_t> publish_subgraph(
        Address const &caller, bytes32_t const &deployment_id,
        bytes32_t const &metadata);

    uint256_t get_curator_signal(
        bytes32_t const &subgraph_id, Address const &curator) const;

    std::optional<MigrationRecord>
    get_migration_record(bytes32_t const &subgraph_id) const;

    std::optional<Subgraph> get_subgraph(bytes32_t const &subgraph_id) const;

    bytes32_t get_curator_slot(
        bytes32_t const &subgraph_id, Address const &curator) const;

    Address const &counterpart() const
    {
        return store_.counterpart;
    }
};

// keccak256 of account, sequence and chain id, packed
bytes32_t
build_subgraph_id(Address const &account, uint64_t sequence, uint64_t chain_id);

HORIZON_MIGRATION_NAMESPACE_END
