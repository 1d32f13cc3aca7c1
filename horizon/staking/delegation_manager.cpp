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
#include <horizon/core/assert.h>
#include <horizon/core/bytes.hpp>
#include <horizon/core/checked_math.hpp>
#include <horizon/core/fmt/address_fmt.hpp> // NOLINT
#include <horizon/core/fmt/int_fmt.hpp> // NOLINT
#include <horizon/core/int.hpp>
#include <horizon/core/likely.h>
#include <horizon/staking/delegation_manager.hpp>
#include <horizon/staking/events.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/thaw_queue.hpp>
#include <horizon/staking/types.hpp>
#include <horizon/staking/util/constants.hpp>
#include <horizon/staking/util/shares.hpp>
#include <horizon/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

HORIZON_STAKING_NAMESPACE_BEGIN

DelegationManager::DelegationManager(StakingStore &store)
    : store_{store}
{
}

Result<uint256_t> DelegationManager::preview_delegate(
    Address const &provider, Address const &verifier,
    uint256_t const &tokens) const
{
    if (HORIZON_UNLIKELY(tokens < MINIMUM_DELEGATION)) {
        return StakingError::MinimumDelegation;
    }
    if (HORIZON_UNLIKELY(!store_.find_provision(provider, verifier))) {
        return StakingError::ProvisionNotFound;
    }
    DelegationPool const *const pool =
        store_.find_delegation_pool(provider, verifier);
    if (!pool) {
        return tokens;
    }
    BOOST_OUTCOME_TRY(checked_add(pool->tokens, tokens));
    return issue_shares(
        pool->tokens - pool->tokens_thawing, pool->shares, tokens);
}

void DelegationManager::apply_delegate(
    Address const &delegator, Address const &provider,
    Address const &verifier, uint256_t const &tokens, uint256_t const &shares)
{
    DelegationPool &pool = store_.delegation_pools[{provider, verifier}];
    pool.tokens += tokens;
    pool.shares += shares;
    pool.delegators[delegator].shares += shares;

    emit_tokens_delegated_event(
        store_, provider, verifier, delegator, tokens, shares);
}

Result<uint256_t> DelegationManager::delegate(
    Address const &caller, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    BOOST_OUTCOME_TRY(
        auto const shares, preview_delegate(provider, verifier, tokens));
    apply_delegate(caller, provider, verifier, tokens, shares);
    return shares;
}

Result<bytes32_t> DelegationManager::undelegate(
    Address const &caller, Address const &provider, Address const &verifier,
    uint256_t const &shares)
{
    if (HORIZON_UNLIKELY(shares == 0)) {
        return StakingError::InvalidZeroShares;
    }
    Provision const *const prov = store_.find_provision(provider, verifier);
    auto const pool_it = store_.delegation_pools.find({provider, verifier});
    if (HORIZON_UNLIKELY(
            !prov || pool_it == store_.delegation_pools.end())) {
        return StakingError::InsufficientShares;
    }
    DelegationPool &pool = pool_it->second;
    auto const delegation_it = pool.delegators.find(caller);
    if (HORIZON_UNLIKELY(
            delegation_it == pool.delegators.end() ||
            delegation_it->second.shares < shares)) {
        return StakingError::InsufficientShares;
    }
    Delegation &delegation = delegation_it->second;

    BOOST_OUTCOME_TRY(
        auto const tokens,
        redeem_shares(pool.tokens - pool.tokens_thawing, pool.shares, shares));

    ThawQueue queue{store_, delegation.thaw_requests};
    BOOST_OUTCOME_TRY(
        auto const id,
        queue.enqueue(
            ThawRequestOwner{
                .type = ThawRequestType::Delegation,
                .provider = provider,
                .verifier = verifier,
                .owner = caller},
            ThawingPool{
                .tokens_thawing = pool.tokens_thawing,
                .shares_thawing = pool.shares_thawing,
                .thawing_nonce = pool.thawing_nonce},
            tokens,
            prov->thawing_period));

    pool.shares -= shares;
    delegation.shares -= shares;

    emit_tokens_undelegated_event(
        store_, provider, verifier, caller, tokens, shares);
    return id;
}

Result<uint256_t> DelegationManager::withdraw_delegated(
    Address const &caller, Address const &provider, Address const &verifier,
    std::optional<RedelegateTarget> const &target)
{
    auto const pool_it = store_.delegation_pools.find({provider, verifier});
    if (pool_it == store_.delegation_pools.end()) {
        return uint256_t{0};
    }
    DelegationPool &pool = pool_it->second;
    auto const delegation_it = pool.delegators.find(caller);
    if (delegation_it == pool.delegators.end()) {
        return uint256_t{0};
    }
    Delegation &delegation = delegation_it->second;

    // delegators are not held back by a provider that moved its stake away
    auto const sp_it = store_.service_providers.find(provider);
    bool const provider_left = sp_it != store_.service_providers.end() &&
                               sp_it->second.migrated &&
                               sp_it->second.tokens_staked == 0;

    BOOST_OUTCOME_TRY(
        auto const tokens,
        thawed_tokens(
            store_,
            delegation.thaw_requests,
            pool.tokens_thawing,
            pool.shares_thawing,
            pool.thawing_nonce,
            provider_left));
    uint256_t shares{0};
    if (target.has_value() && tokens != 0) {
        BOOST_OUTCOME_TRY(
            shares,
            preview_delegate(target->provider, target->verifier, tokens));
    }

    ThawQueue queue{store_, delegation.thaw_requests};
    BOOST_OUTCOME_TRY(
        auto const collected,
        queue.collect_releasable(
            ThawingPool{
                .tokens_thawing = pool.tokens_thawing,
                .shares_thawing = pool.shares_thawing,
                .thawing_nonce = pool.thawing_nonce},
            provider_left));
    HORIZON_ASSERT(collected == tokens);
    if (collected == 0) {
        return collected;
    }
    pool.tokens -= collected;

    if (target.has_value()) {
        apply_delegate(
            caller, target->provider, target->verifier, collected, shares);
    }
    else {
        store_.credit(caller, collected);
    }
    emit_delegated_tokens_withdrawn_event(
        store_, provider, verifier, caller, collected);
    return collected;
}

Result<void> DelegationManager::add_to_delegation_pool(
    Address const &caller, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    if (HORIZON_UNLIKELY(!store_.find_provision(provider, verifier))) {
        return StakingError::ProvisionNotFound;
    }
    auto const pool_it = store_.delegation_pools.find({provider, verifier});
    if (HORIZON_UNLIKELY(
            pool_it == store_.delegation_pools.end() ||
            pool_it->second.shares == 0)) {
        return StakingError::InvalidPoolState;
    }
    BOOST_OUTCOME_TRY(
        auto const pool_tokens, checked_add(pool_it->second.tokens, tokens));
    pool_it->second.tokens = pool_tokens;

    LOG_DEBUG(
        "{} added {} tokens to the delegation pool of {} for verifier {}",
        caller,
        tokens,
        provider,
        verifier);
    emit_tokens_to_delegation_pool_added_event(
        store_, provider, verifier, tokens);
    return outcome::success();
}

uint256_t DelegationManager::get_delegated_shares(
    Address const &provider, Address const &verifier,
    Address const &delegator) const
{
    DelegationPool const *const pool =
        store_.find_delegation_pool(provider, verifier);
    if (!pool) {
        return 0;
    }
    auto const it = pool->delegators.find(delegator);
    return it == pool->delegators.end() ? uint256_t{0} : it->second.shares;
}

HORIZON_STAKING_NAMESPACE_END
