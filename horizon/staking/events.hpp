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
#include <horizon/staking/config.hpp>

#include <cstdint>

HORIZON_STAKING_NAMESPACE_BEGIN

struct StakingStore;

void emit_stake_deposited_event(
    StakingStore &, Address const &provider, uint256_t const &tokens);
void emit_stake_withdrawn_event(
    StakingStore &, Address const &provider, uint256_t const &tokens);
void emit_stake_locked_event(
    StakingStore &, Address const &provider, uint256_t const &tokens,
    uint64_t until);
void emit_legacy_stake_withdrawn_event(
    StakingStore &, Address const &provider, uint256_t const &tokens);
void emit_stake_migrated_event(
    StakingStore &, Address const &provider, uint256_t const &tokens);

void emit_provision_created_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint256_t const &tokens, uint32_t max_verifier_cut,
    uint64_t thawing_period);
void emit_provision_increased_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint256_t const &tokens);
void emit_provision_thawed_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint256_t const &tokens);
void emit_tokens_deprovisioned_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint256_t const &tokens);
void emit_provision_parameters_staged_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint32_t max_verifier_cut, uint64_t thawing_period);
void emit_provision_parameters_set_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint32_t max_verifier_cut, uint64_t thawing_period);

void emit_provision_slashed_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint256_t const &tokens);
void emit_verifier_tokens_sent_event(
    StakingStore &, Address const &provider, Address const &verifier,
    Address const &destination, uint256_t const &tokens);
void emit_delegation_slashed_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint256_t const &tokens);
void emit_delegation_slashing_skipped_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint256_t const &tokens);

void emit_tokens_delegated_event(
    StakingStore &, Address const &provider, Address const &verifier,
    Address const &delegator, uint256_t const &tokens,
    uint256_t const &shares);
void emit_tokens_undelegated_event(
    StakingStore &, Address const &provider, Address const &verifier,
    Address const &delegator, uint256_t const &tokens,
    uint256_t const &shares);
void emit_delegated_tokens_withdrawn_event(
    StakingStore &, Address const &provider, Address const &verifier,
    Address const &delegator, uint256_t const &tokens);
void emit_tokens_to_delegation_pool_added_event(
    StakingStore &, Address const &provider, Address const &verifier,
    uint256_t const &tokens);

void emit_thaw_request_created_event(
    StakingStore &, Address const &provider, Address const &verifier,
    Address const &owner, uint256_t const &shares, uint64_t thawing_until,
    bytes32_t const &id);
void emit_thaw_request_fulfilled_event(
    StakingStore &, bytes32_t const &id, uint256_t const &tokens,
    uint256_t const &shares, uint64_t thawing_until, bool valid);

HORIZON_STAKING_NAMESPACE_END
