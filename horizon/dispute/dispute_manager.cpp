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

#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/checked_math.hpp>
#include <horizon/core/contract/abi_encode.hpp>
#include <horizon/core/contract/abi_signatures.hpp>
#include <horizon/core/contract/events.hpp>
#include <horizon/core/fmt/address_fmt.hpp> // NOLINT
#include <horizon/core/fmt/bytes_fmt.hpp> // NOLINT
#include <horizon/core/fmt/int_fmt.hpp> // NOLINT
#include <horizon/core/int.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/core/likely.h>
#include <horizon/dispute/attestation.hpp>
#include <horizon/dispute/dispute_error.hpp>
#include <horizon/dispute/dispute_manager.hpp>
#include <horizon/dispute/types.hpp>
#include <horizon/staking/provision_manager.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/util/shares.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstdint>

HORIZON_DISPUTE_NAMESPACE_BEGIN

namespace
{
    void emit_dispute_created_event(
        DisputeStore &store, bytes32_t const &id, Dispute const &dispute)
    {
        constexpr bytes32_t signature = abi_encode_event_signature(
            "DisputeCreated(bytes32,address,address,uint256,uint8)");
        static_assert(
            signature ==
            0xfd2b199937420ac7c97595332078a6d97dec68462370f4afc4952c453f0dc658_bytes32);

        auto const event = EventBuilder(DISPUTE_MANAGER_CA, signature)
                               .add_topic(id)
                               .add_topic(abi_encode_address(dispute.indexer))
                               .add_topic(abi_encode_address(dispute.fisherman))
                               .add_data(abi_encode_uint(dispute.deposit))
                               .add_data(abi_encode_uint(
                                   static_cast<uint8_t>(dispute.type)))
                               .build();
        store.emit_log(event);
    }

    void emit_dispute_linked_event(
        DisputeStore &store, bytes32_t const &id1, bytes32_t const &id2)
    {
        constexpr bytes32_t signature =
            abi_encode_event_signature("DisputeLinked(bytes32,bytes32)");
        static_assert(
            signature ==
            0xfec135a4cf8e5c6e13dea23be058bf03a8bf8f1f6fb0a021b0a5aeddfba81407_bytes32);

        auto const event = EventBuilder(DISPUTE_MANAGER_CA, signature)
                               .add_topic(id1)
                               .add_topic(id2)
                               .build();
        store.emit_log(event);
    }

    void emit_dispute_accepted_event(
        DisputeStore &store, bytes32_t const &id, Dispute const &dispute,
        uint256_t const &tokens)
    {
        constexpr bytes32_t signature = abi_encode_event_signature(
            "DisputeAccepted(bytes32,address,address,uint256)");
        static_assert(
            signature ==
            0x6d800aaaf64b9a1f321dcd63da04369d33d8a0d49ad0fbba085aab4a98bf31c4_bytes32);

        auto const event = EventBuilder(DISPUTE_MANAGER_CA, signature)
                               .add_topic(id)
                               .add_topic(abi_encode_address(dispute.indexer))
                               .add_topic(abi_encode_address(dispute.fisherman))
                               .add_data(abi_encode_uint(tokens))
                               .build();
        store.emit_log(event);
    }

    void emit_dispute_rejected_event(
        DisputeStore &store, bytes32_t const &id, Dispute const &dispute,
        uint256_t const &tokens)
    {
        constexpr bytes32_t signature = abi_encode_event_signature(
            "DisputeRejected(bytes32,address,address,uint256)");
        static_assert(
            signature ==
            0x2226ebd23625a7938fb786df2248bd171d2e6ad70cb2b654ea1be830ca17224d_bytes32);

        auto const event = EventBuilder(DISPUTE_MANAGER_CA, signature)
                               .add_topic(id)
                               .add_topic(abi_encode_address(dispute.indexer))
                               .add_topic(abi_encode_address(dispute.fisherman))
                               .add_data(abi_encode_uint(tokens))
                               .build();
        store.emit_log(event);
    }

    void emit_dispute_drawn_event(
        DisputeStore &store, bytes32_t const &id, Dispute const &dispute,
        uint256_t const &tokens)
    {
        constexpr bytes32_t signature = abi_encode_event_signature(
            "DisputeDrawn(bytes32,address,address,uint256)");
        static_assert(
            signature ==
            0xf0912efb86ea1d65a17d64d48393cdb1ca0ea5220dd2bbe438621199d30955b7_bytes32);

        auto const event = EventBuilder(DISPUTE_MANAGER_CA, signature)
                               .add_topic(id)
                               .add_topic(abi_encode_address(dispute.indexer))
                               .add_topic(abi_encode_address(dispute.fisherman))
                               .add_data(abi_encode_uint(tokens))
                               .build();
        store.emit_log(event);
    }

    void emit_dispute_cancelled_event(
        DisputeStore &store, bytes32_t const &id, Dispute const &dispute,
        uint256_t const &tokens)
    {
        constexpr bytes32_t signature = abi_encode_event_signature(
            "DisputeCancelled(bytes32,address,address,uint256)");
        static_assert(
            signature ==
            0x223103f8eb52e5f43a75655152acd882a605d70df57a5c0fefd30f516b1756d2_bytes32);

        auto const event = EventBuilder(DISPUTE_MANAGER_CA, signature)
                               .add_topic(id)
                               .add_topic(abi_encode_address(dispute.indexer))
                               .add_topic(abi_encode_address(dispute.fisherman))
                               .add_data(abi_encode_uint(tokens))
                               .build();
        store.emit_log(event);
    }
}

bytes32_t query_dispute_id(
    bytes32_t const &request_cid, bytes32_t const &response_cid,
    bytes32_t const &subgraph_deployment_id, Address const &indexer,
    Address const &fisherman)
{
    byte_string input;
    input += to_byte_string_view(request_cid.bytes);
    input += to_byte_string_view(response_cid.bytes);
    input += to_byte_string_view(subgraph_deployment_id.bytes);
    input += to_byte_string_view(indexer.bytes);
    input += to_byte_string_view(fisherman.bytes);
    return to_bytes(keccak256(input));
}

bytes32_t indexing_dispute_id(Address const &allocation)
{
    return to_bytes(keccak256(to_byte_string_view(allocation.bytes)));
}

DisputeManager::DisputeManager(
    DisputeStore &store, staking::StakingStore const &staking,
    staking::ProvisionManager &provisions, DisputeParams const &params)
    : store_{store}
    , staking_{staking}
    , provisions_{provisions}
    , params_{params}
{
}

Result<void> DisputeManager::check_indexer(Address const &indexer) const
{
    auto const *const prov =
        staking_.find_provision(indexer, DISPUTE_MANAGER_CA);
    if (HORIZON_UNLIKELY(!prov || prov->tokens == 0)) {
        return DisputeError::IndexerNotFound;
    }
    return outcome::success();
}

Result<Dispute *> DisputeManager::pending_dispute(bytes32_t const &id)
{
    auto const it = store_.disputes.find(id);
    if (HORIZON_UNLIKELY(it == store_.disputes.end())) {
        return DisputeError::InvalidDispute;
    }
    if (HORIZON_UNLIKELY(it->second.status != DisputeStatus::Pending)) {
        return DisputeError::DisputeNotPending;
    }
    return &it->second;
}

Result<bytes32_t> DisputeManager::create(
    bytes32_t const &id, DisputeType const type, Address const &indexer,
    Address const &fisherman, uint256_t const &deposit)
{
    Dispute const dispute{
        .indexer = indexer,
        .fisherman = fisherman,
        .deposit = deposit,
        .related_dispute_id = bytes32_t{},
        .type = type,
        .status = DisputeStatus::Pending,
        .created_at = staking_.now};
    store_.disputes.emplace(id, dispute);
    store_.deposits += deposit;

    emit_dispute_created_event(store_, id, dispute);
    return id;
}

Result<bytes32_t> DisputeManager::create_query_dispute(
    Address const &fisherman, byte_string_view const attestation,
    uint256_t const &deposit, Address const &indexer)
{
    BOOST_OUTCOME_TRY(auto const att, decode_attestation(attestation));
    if (HORIZON_UNLIKELY(deposit < params_.minimum_deposit)) {
        return DisputeError::InsufficientDeposit;
    }
    BOOST_OUTCOME_TRY(check_indexer(indexer));

    bytes32_t const id = query_dispute_id(
        att.request_cid,
        att.response_cid,
        att.subgraph_deployment_id,
        indexer,
        fisherman);
    if (HORIZON_UNLIKELY(store_.disputes.contains(id))) {
        return DisputeError::DisputeAlreadyCreated;
    }
    return create(id, DisputeType::Query, indexer, fisherman, deposit);
}

Result<std::pair<bytes32_t, bytes32_t>>
DisputeManager::create_query_dispute_conflict(
    Address const &fisherman, byte_string_view const attestation1,
    Address const &indexer1, byte_string_view const attestation2,
    Address const &indexer2)
{
    BOOST_OUTCOME_TRY(auto const att1, decode_attestation(attestation1));
    BOOST_OUTCOME_TRY(auto const att2, decode_attestation(attestation2));
    if (HORIZON_UNLIKELY(!are_conflicting(att1, att2))) {
        return DisputeError::NonConflictingAttestations;
    }
    BOOST_OUTCOME_TRY(check_indexer(indexer1));
    BOOST_OUTCOME_TRY(check_indexer(indexer2));

    bytes32_t const id1 = query_dispute_id(
        att1.request_cid,
        att1.response_cid,
        att1.subgraph_deployment_id,
        indexer1,
        fisherman);
    bytes32_t const id2 = query_dispute_id(
        att2.request_cid,
        att2.response_cid,
        att2.subgraph_deployment_id,
        indexer2,
        fisherman);
    if (HORIZON_UNLIKELY(
            store_.disputes.contains(id1) || store_.disputes.contains(id2))) {
        return DisputeError::DisputeAlreadyCreated;
    }

    BOOST_OUTCOME_TRY(create(id1, DisputeType::Query, indexer1, fisherman, 0));
    BOOST_OUTCOME_TRY(create(id2, DisputeType::Query, indexer2, fisherman, 0));
    store_.disputes.at(id1).related_dispute_id = id2;
    store_.disputes.at(id2).related_dispute_id = id1;

    emit_dispute_linked_event(store_, id1, id2);
    return std::make_pair(id1, id2);
}

Result<bytes32_t> DisputeManager::create_indexing_dispute(
    Address const &fisherman, Address const &allocation,
    uint256_t const &deposit, Address const &indexer)
{
    if (HORIZON_UNLIKELY(deposit < params_.minimum_deposit)) {
        return DisputeError::InsufficientDeposit;
    }
    BOOST_OUTCOME_TRY(check_indexer(indexer));

    bytes32_t const id = indexing_dispute_id(allocation);
    if (HORIZON_UNLIKELY(store_.disputes.contains(id))) {
        return DisputeError::DisputeAlreadyCreated;
    }
    return create(id, DisputeType::Indexing, indexer, fisherman, deposit);
}

void DisputeManager::settle(
    bytes32_t const &id, Dispute &dispute, DisputeStatus const status,
    bool const return_deposit)
{
    dispute.status = status;
    store_.deposits -= dispute.deposit;
    if (return_deposit) {
        store_.returned[dispute.fisherman] += dispute.deposit;
    }
    else {
        store_.burned += dispute.deposit;
    }

    switch (status) {
    case DisputeStatus::Rejected:
        emit_dispute_rejected_event(store_, id, dispute, dispute.deposit);
        break;
    case DisputeStatus::Drawn:
        emit_dispute_drawn_event(store_, id, dispute, dispute.deposit);
        break;
    case DisputeStatus::Cancelled:
        emit_dispute_cancelled_event(store_, id, dispute, dispute.deposit);
        break;
    default:
        break;
    }
}

Result<void> DisputeManager::accept(
    Address const &caller, bytes32_t const &id, uint256_t const &tokens_slash)
{
    if (HORIZON_UNLIKELY(caller != params_.arbitrator)) {
        return DisputeError::NotArbitrator;
    }
    BOOST_OUTCOME_TRY(auto *const dispute, pending_dispute(id));

    auto const *const prov =
        staking_.find_provision(dispute->indexer, DISPUTE_MANAGER_CA);
    auto const *const pool =
        staking_.find_delegation_pool(dispute->indexer, DISPUTE_MANAGER_CA);
    uint256_t const slashable =
        (prov ? prov->tokens : uint256_t{0}) +
        (pool ? pool->tokens : uint256_t{0});
    BOOST_OUTCOME_TRY(
        auto const max_slash,
        staking::ppm_mul(slashable, params_.max_slashing_cut));
    if (HORIZON_UNLIKELY(tokens_slash > max_slash)) {
        return DisputeError::InvalidTokensSlash;
    }
    BOOST_OUTCOME_TRY(
        auto const reward,
        staking::ppm_mul(tokens_slash, params_.fisherman_reward_cut));

    BOOST_OUTCOME_TRY(provisions_.slash(
        DISPUTE_MANAGER_CA,
        dispute->indexer,
        tokens_slash,
        reward,
        dispute->fisherman));

    dispute->status = DisputeStatus::Accepted;
    store_.deposits -= dispute->deposit;
    store_.returned[dispute->fisherman] += dispute->deposit;

    LOG_INFO(
        "Dispute {} accepted, indexer {} slashed by {}, fisherman reward {}",
        id,
        dispute->indexer,
        tokens_slash,
        reward);
    emit_dispute_accepted_event(
        store_, id, *dispute, dispute->deposit + reward);

    auto const related = store_.disputes.find(dispute->related_dispute_id);
    if (related != store_.disputes.end() &&
        related->second.status == DisputeStatus::Pending) {
        settle(related->first, related->second, DisputeStatus::Rejected, false);
    }
    return outcome::success();
}

Result<void> DisputeManager::reject(Address const &caller, bytes32_t const &id)
{
    if (HORIZON_UNLIKELY(caller != params_.arbitrator)) {
        return DisputeError::NotArbitrator;
    }
    BOOST_OUTCOME_TRY(auto *const dispute, pending_dispute(id));

    auto const related = store_.disputes.find(dispute->related_dispute_id);
    if (HORIZON_UNLIKELY(
            related != store_.disputes.end() &&
            related->second.status == DisputeStatus::Pending)) {
        return DisputeError::MustAcceptRelated;
    }

    settle(id, *dispute, DisputeStatus::Rejected, false);
    return outcome::success();
}

Result<void> DisputeManager::draw(Address const &caller, bytes32_t const &id)
{
    if (HORIZON_UNLIKELY(caller != params_.arbitrator)) {
        return DisputeError::NotArbitrator;
    }
    BOOST_OUTCOME_TRY(auto *const dispute, pending_dispute(id));

    settle(id, *dispute, DisputeStatus::Drawn, true);
    auto const related = store_.disputes.find(dispute->related_dispute_id);
    if (related != store_.disputes.end() &&
        related->second.status == DisputeStatus::Pending) {
        settle(related->first, related->second, DisputeStatus::Drawn, true);
    }
    return outcome::success();
}

Result<void> DisputeManager::cancel(Address const &caller, bytes32_t const &id)
{
    BOOST_OUTCOME_TRY(auto *const dispute, pending_dispute(id));
    if (HORIZON_UNLIKELY(caller != dispute->fisherman)) {
        return DisputeError::NotFisherman;
    }
    if (HORIZON_UNLIKELY(
            staking_.now < dispute->created_at + params_.dispute_period)) {
        return DisputeError::DisputePeriodNotFinished;
    }

    settle(id, *dispute, DisputeStatus::Cancelled, true);
    auto const related = store_.disputes.find(dispute->related_dispute_id);
    if (related != store_.disputes.end() &&
        related->second.status == DisputeStatus::Pending) {
        settle(related->first, related->second, DisputeStatus::Cancelled, true);
    }
    return outcome::success();
}

std::optional<Dispute> DisputeManager::get_dispute(bytes32_t const &id) const
{
    auto const it = store_.disputes.find(id);
    if (it == store_.disputes.end()) {
        return std::nullopt;
    }
    return it->second;
}

HORIZON_DISPUTE_NAMESPACE_END
