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
#include <horizon/dispute/config.hpp>
#include <horizon/dispute/types.hpp>

#include <cstdint>
#include <optional>
#include <utility>

namespace horizon::staking
{
    class ProvisionManager;
    struct StakingStore;
}

HORIZON_DISPUTE_NAMESPACE_BEGIN

// Disputes against indexers that provisioned to DISPUTE_MANAGER_CA. Accepted
// disputes slash the provision through the staking ledger, with the
// fisherman reward paid as the verifier cut.
class DisputeManager
{
    DisputeStore &store_;
    staking::StakingStore const &staking_;
    staking::ProvisionManager &provisions_;
    DisputeParams params_;

    Result<void> check_indexer(Address const &indexer) const;

    Result<Dispute *> pending_dispute(bytes32_t const &id);

    Result<bytes32_t> create(
        bytes32_t const &id, DisputeType, Address const &indexer,
        Address const &fisherman, uint256_t const &deposit);

    void settle(
        bytes32_t const &id, Dispute &, DisputeStatus, bool return_deposit);

public:
    DisputeManager(
        DisputeStore &, staking::StakingStore const &,
        staking::ProvisionManager &, DisputeParams const &);

    Result<bytes32_t> create_query_dispute(
        Address const &fisherman, byte_string_view attestation,
        uint256_t const &deposit, Address const &indexer);

    // Two attestations answering the same request differently. Both
    // disputes are created without a deposit and linked to each other.
    Result<std::pair<bytes32_t, bytes32_t>> create_query_dispute_conflict(
        Address const &fisherman, byte_string_view attestation1,
        Address const &indexer1, byte_string_view attestation2,
        Address const &indexer2);

    Result<bytes32_t> create_indexing_dispute(
        Address const &fisherman, Address const &allocation,
        uint256_t const &deposit, Address const &indexer);

    Result<void> accept(
        Address const &caller, bytes32_t const &id,
        uint256_t const &tokens_slash);

    Result<void> reject(Address const &caller, bytes32_t const &id);

    Result<void> draw(Address const &caller, bytes32_t const &id);

    Result<void> cancel(Address const &caller, bytes32_t const &id);

    std::optional<Dispute> get_dispute(bytes32_t const &id) const;

    uint256_t const &minimum_deposit() const
    {
        return params_.minimum_deposit;
    }

    uint32_t fisherman_reward_cut() const
    {
        return params_.fisherman_reward_cut;
    }

    uint64_t dispute_period() const
    {
        return params_.dispute_period;
    }
};

bytes32_t query_dispute_id(
    bytes32_t const &request_cid, bytes32_t const &response_cid,
    bytes32_t const &subgraph_deployment_id, Address const &indexer,
    Address const &fisherman);

bytes32_t indexing_dispute_id(Address const &allocation);

HORIZON_DISPUTE_NAMESPACE_END
