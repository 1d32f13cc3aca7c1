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

#include <horizon/chain/state_root.hpp>
#include <horizon/core/address.hpp>
#include <horizon/core/assert.h>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/contract/abi_encode.hpp>
#include <horizon/core/fmt/address_fmt.hpp> // NOLINT
#include <horizon/core/fmt/bytes_fmt.hpp> // NOLINT
#include <horizon/core/fmt/int_fmt.hpp> // NOLINT
#include <horizon/core/int.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/core/likely.h>
#include <horizon/migration/constants.hpp>
#include <horizon/migration/coordinator.hpp>
#include <horizon/migration/curation.hpp>
#include <horizon/migration/events.hpp>
#include <horizon/migration/l1_gns.hpp>
#include <horizon/migration/migration_error.hpp>
#include <horizon/migration/state_proof.hpp>
#include <horizon/migration/types.hpp>
#include <horizon/mpt/proof.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <utility>

HORIZON_MIGRATION_NAMESPACE_BEGIN

bytes32_t build_subgraph_id(
    Address const &account, uint64_t const sequence, uint64_t const chain_id)
{
    byte_string input;
    input += to_byte_string_view(account.bytes);
    input += to_byte_string_view(abi_encode_uint(sequence).bytes);
    input += to_byte_string_view(abi_encode_uint(chain_id).bytes);
    return to_bytes(keccak256(input));
}

MigrationCoordinator::MigrationCoordinator(
    MigrationStore &store, Curation &curation, MigrationParams const &params)
    : store_{store}
    , curation_{curation}
    , params_{params}
{
}

Result<void> MigrationCoordinator::on_token_transfer(
    Address const &caller, Address const &from, uint256_t const &amount,
    byte_string_view const callhook_data)
{
    if (HORIZON_UNLIKELY(caller != params_.gateway)) {
        return MigrationError::OnlyGateway;
    }
    if (HORIZON_UNLIKELY(from != store_.counterpart)) {
        return MigrationError::OnlyCounterpartThroughBridge;
    }
    BOOST_OUTCOME_TRY(auto const data, decode_callhook_data(callhook_data));
    if (HORIZON_UNLIKELY(data.owner == Address{})) {
        return MigrationError::InvalidInput;
    }

    auto const record = store_.migrations.find(data.subgraph_id);
    bool const pending =
        record != store_.migrations.end() && !record->second.l2_done;
    if (HORIZON_UNLIKELY(
            !pending && store_.subgraphs.contains(data.subgraph_id))) {
        return MigrationError::AlreadyFinalized;
    }

    auto &migration = store_.migrations[data.subgraph_id];
    migration.tokens = amount;
    migration.locked_at_block_hash = data.lock_block_hash;
    migration.l1_done = true;
    migration.l2_done = false;
    migration.deprecated = false;

    auto &subgraph = store_.subgraphs[data.subgraph_id];
    subgraph.n_signal = data.n_signal;
    subgraph.v_signal = 0;
    subgraph.deployment_id = bytes32_t{};
    subgraph.reserve_ratio = data.reserve_ratio;
    subgraph.disabled = true;
    subgraph.owner = data.owner;
    subgraph.metadata = data.metadata;

    store_.tokens_received += amount;

    LOG_INFO(
        "Subgraph {} received from L1 with {} tokens, owner {}",
        data.subgraph_id,
        amount,
        data.owner);
    emit_subgraph_received_from_l1_event(
        store_, data.subgraph_id, data.owner, amount);
    emit_subgraph_metadata_updated_event(
        store_, data.subgraph_id, data.metadata);
    return outcome::success();
}

Result<void> MigrationCoordinator::finish_migration(
    Address const &caller, bytes32_t const &subgraph_id,
    bytes32_t const &deployment_id, bytes32_t const &metadata)
{
    auto const subgraph_it = store_.subgraphs.find(subgraph_id);
    auto const record_it = store_.migrations.find(subgraph_id);
    if (HORIZON_UNLIKELY(
            subgraph_it == store_.subgraphs.end() ||
            record_it == store_.migrations.end() ||
            record_it->second.l2_done)) {
        return MigrationError::NotMigrated;
    }
    auto &subgraph = subgraph_it->second;
    auto &record = record_it->second;
    if (HORIZON_UNLIKELY(caller != subgraph.owner)) {
        return MigrationError::NotAuthorized;
    }
    if (HORIZON_UNLIKELY(deployment_id == bytes32_t{})) {
        return MigrationError::DeploymentZero;
    }
    if (HORIZON_UNLIKELY(curation_.get_deployment_signal(deployment_id) != 0)) {
        return MigrationError::PreCurated;
    }

    BOOST_OUTCOME_TRY(
        auto const v_signal,
        curation_.mint_signal_no_tax(deployment_id, record.tokens));

    subgraph.deployment_id = deployment_id;
    subgraph.v_signal = v_signal;
    subgraph.disabled = false;
    subgraph.metadata = metadata;
    record.l2_done = true;
    store_.tokens_curated += record.tokens;

    LOG_INFO(
        "Subgraph {} migration finished on deployment {}, {} signal minted",
        subgraph_id,
        deployment_id,
        v_signal);
    emit_subgraph_published_event(
        store_, subgraph_id, deployment_id, subgraph.reserve_ratio);
    emit_subgraph_metadata_updated_event(store_, subgraph_id, metadata);
    emit_subgraph_migration_finalized_event(store_, subgraph_id);
    return outcome::success();
}

Result<MigrationRecord *>
MigrationCoordinator::finalized_record(bytes32_t const &subgraph_id)
{
    auto const it = store_.migrations.find(subgraph_id);
    if (HORIZON_UNLIKELY(
            it == store_.migrations.end() || !it->second.l2_done)) {
        return MigrationError::NotMigrated;
    }
    return &it->second;
}

void MigrationCoordinator::credit_signal(
    bytes32_t const &subgraph_id, MigrationRecord &record,
    Address const &l1_curator, Address const &beneficiary,
    uint256_t const &n_signal)
{
    record.claimed.insert(l1_curator);
    store_.subgraphs.at(subgraph_id).curator_signal[beneficiary] += n_signal;

    LOG_INFO(
        "Curator {} claimed {} signal on subgraph {} for {}",
        l1_curator,
        n_signal,
        subgraph_id,
        beneficiary);
    emit_curator_balance_claimed_event(
        store_, subgraph_id, l1_curator, beneficiary, n_signal);
}

Result<uint256_t> MigrationCoordinator::claim_l1_curator_balance(
    Address const &caller, bytes32_t const &subgraph_id,
    byte_string_view const header_rlp, byte_string_view const proof_rlp)
{
    BOOST_OUTCOME_TRY(auto *const record, finalized_record(subgraph_id));
    if (HORIZON_UNLIKELY(record->claimed.contains(caller))) {
        return MigrationError::AlreadyClaimed;
    }

    BOOST_OUTCOME_TRY(
        auto const state_root,
        chain::decode_verified_state_root(
            header_rlp, record->locked_at_block_hash));
    BOOST_OUTCOME_TRY(auto const proof, decode_state_proof(proof_rlp));

    auto storage_root = mpt::get_account_storage_root(
        state_root, store_.counterpart, proof.account_proof);
    if (HORIZON_UNLIKELY(storage_root.has_error())) {
        LOG_DEBUG(
            "Rejected account proof for {} on subgraph {}",
            caller,
            subgraph_id);
        return std::move(storage_root).as_failure();
    }
    auto n_signal = mpt::get_storage_value(
        storage_root.value(),
        l1_gns_curator_slot(subgraph_id, caller),
        proof.storage_proof);
    if (HORIZON_UNLIKELY(n_signal.has_error())) {
        LOG_DEBUG(
            "Rejected storage proof for {} on subgraph {}",
            caller,
            subgraph_id);
        return std::move(n_signal).as_failure();
    }

    credit_signal(subgraph_id, *record, caller, caller, n_signal.value());
    return n_signal.value();
}

Result<void> MigrationCoordinator::claim_l1_curator_balance_to_beneficiary(
    Address const &caller, bytes32_t const &subgraph_id,
    Address const &l1_curator, uint256_t const &n_signal,
    Address const &beneficiary)
{
    if (HORIZON_UNLIKELY(caller != apply_l1_to_l2_alias(store_.counterpart))) {
        return MigrationError::OnlyCounterpartAlias;
    }
    BOOST_OUTCOME_TRY(auto *const record, finalized_record(subgraph_id));
    if (HORIZON_UNLIKELY(record->claimed.contains(l1_curator))) {
        return MigrationError::AlreadyClaimed;
    }

    credit_signal(subgraph_id, *record, l1_curator, beneficiary, n_signal);
    return outcome::success();
}

Result<void> MigrationCoordinator::set_counterpart_address(
    Address const &caller, Address const &counterpart)
{
    if (HORIZON_UNLIKELY(caller != params_.governor)) {
        return MigrationError::NotAuthorized;
    }
    store_.counterpart = counterpart;
    emit_counterpart_gns_address_updated_event(store_, counterpart);
    return outcome::success();
}

Result<bytes32_t> MigrationCoordinator::publish_subgraph(
    Address const &caller, bytes32_t const &deployment_id,
    bytes32_t const &metadata)
{
    if (HORIZON_UNLIKELY(deployment_id == bytes32_t{})) {
        return MigrationError::DeploymentZero;
    }

    uint64_t &sequence = store_.next_sequence[caller];
    bytes32_t const subgraph_id =
        build_subgraph_id(caller, sequence, params_.chain_id);
    HORIZON_ASSERT(!store_.subgraphs.contains(subgraph_id));
    ++sequence;

    store_.subgraphs.emplace(
        subgraph_id,
        Subgraph{
            .n_signal = 0,
            .v_signal = 0,
            .deployment_id = deployment_id,
            .reserve_ratio = DEFAULT_RESERVE_RATIO,
            .disabled = false,
            .owner = caller,
            .metadata = metadata,
            .curator_signal = {}});

    emit_subgraph_published_event(
        store_, subgraph_id, deployment_id, DEFAULT_RESERVE_RATIO);
    emit_subgraph_metadata_updated_event(store_, subgraph_id, metadata);
    return subgraph_id;
}

uint256_t MigrationCoordinator::get_curator_signal(
    bytes32_t const &subgraph_id, Address const &curator) const
{
    auto const subgraph = store_.subgraphs.find(subgraph_id);
    if (subgraph == store_.subgraphs.end()) {
        return 0;
    }
    auto const signal = subgraph->second.curator_signal.find(curator);
    return signal == subgraph->second.curator_signal.end() ? uint256_t{0}
                                                           : signal->second;
}

std::optional<MigrationRecord>
MigrationCoordinator::get_migration_record(bytes32_t const &subgraph_id) const
{
    auto const it = store_.migrations.find(subgraph_id);
    if (it == store_.migrations.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Subgraph>
MigrationCoordinator::get_subgraph(bytes32_t const &subgraph_id) const
{
    auto const it = store_.subgraphs.find(subgraph_id);
    if (it == store_.subgraphs.end()) {
        return std::nullopt;
    }
    return it->second;
}

bytes32_t MigrationCoordinator::get_curator_slot(
    bytes32_t const &subgraph_id, Address const &curator) const
{
    return l1_gns_curator_slot(subgraph_id, curator);
}

HORIZON_MIGRATION_NAMESPACE_END
