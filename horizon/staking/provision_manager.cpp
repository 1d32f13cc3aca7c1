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
#include <horizon/core/bytes.hpp>
#include <horizon/core/checked_math.hpp>
#include <horizon/core/fmt/address_fmt.hpp> // NOLINT
#include <horizon/core/fmt/int_fmt.hpp> // NOLINT
#include <horizon/core/int.hpp>
#include <horizon/core/likely.h>
#include <horizon/staking/authorizer.hpp>
#include <horizon/staking/events.hpp>
#include <horizon/staking/provision_manager.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/thaw_queue.hpp>
#include <horizon/staking/util/constants.hpp>
#include <horizon/staking/util/shares.hpp>
#include <horizon/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>

HORIZON_STAKING_ANONYMOUS_NAMESPACE_BEGIN

Result<void> check_provision_parameters(
    StakingParams const &params, uint32_t const max_verifier_cut,
    uint64_t const thawing_period)
{
    if (HORIZON_UNLIKELY(max_verifier_cut > MAX_MAX_VERIFIER_CUT)) {
        return StakingError::InvalidMaxVerifierCut;
    }
    if (HORIZON_UNLIKELY(thawing_period > params.max_thawing_period)) {
        return StakingError::InvalidThawingPeriod;
    }
    return outcome::success();
}

Result<void> check_idle_stake(
    StakingStore const &store, Address const &provider,
    uint256_t const &tokens)
{
    auto const it = store.service_providers.find(provider);
    uint256_t const idle =
        it == store.service_providers.end() ? 0 : idle_stake(it->second);
    if (HORIZON_UNLIKELY(idle < tokens)) {
        return StakingError::InsufficientIdleStake;
    }
    return outcome::success();
}

// Shrinks a sub-pool of `before` tokens by `slashed`, scaling its thawing
// tokens by the same fraction. Thawing shares left with no tokens behind
// them are dropped and the nonce bump voids their requests.
void slash_thawing(
    uint256_t const &before, uint256_t const &slashed,
    uint256_t &tokens_thawing, uint256_t &shares_thawing,
    uint64_t &thawing_nonce)
{
    uint512_t const scaled =
        intx::umul(tokens_thawing, before - slashed) / uint512_t{before};
    tokens_thawing = static_cast<uint256_t>(scaled);
    if (shares_thawing != 0 && tokens_thawing == 0) {
        shares_thawing = 0;
        ++thawing_nonce;
    }
}

HORIZON_STAKING_ANONYMOUS_NAMESPACE_END

HORIZON_STAKING_NAMESPACE_BEGIN

ProvisionManager::ProvisionManager(
    StakingStore &store, Authorizer const &authorizer)
    : store_{store}
    , authorizer_{authorizer}
{
}

Result<void> ProvisionManager::check_authorized(
    Address const &caller, Address const &provider,
    Address const &verifier) const
{
    if (HORIZON_UNLIKELY(
            !authorizer_.is_authorized(provider, verifier, caller))) {
        return StakingError::NotAuthorized;
    }
    return outcome::success();
}

Result<void> ProvisionManager::provision(
    Address const &caller, Address const &provider, Address const &verifier,
    uint256_t const &tokens, uint32_t const max_verifier_cut,
    uint64_t const thawing_period)
{
    BOOST_OUTCOME_TRY(check_authorized(caller, provider, verifier));
    if (HORIZON_UNLIKELY(tokens < MIN_PROVISION_SIZE)) {
        return StakingError::ProvisionTooSmall;
    }
    BOOST_OUTCOME_TRY(check_provision_parameters(
        store_.params, max_verifier_cut, thawing_period));
    if (HORIZON_UNLIKELY(store_.find_provision(provider, verifier))) {
        return StakingError::ProvisionAlreadyExists;
    }
    BOOST_OUTCOME_TRY(check_idle_stake(store_, provider, tokens));

    store_.provisions.emplace(
        ProvisionKey{provider, verifier},
        Provision{
            .tokens = tokens,
            .max_verifier_cut = max_verifier_cut,
            .thawing_period = thawing_period,
            .created_at = store_.now,
            .max_verifier_cut_pending = max_verifier_cut,
            .thawing_period_pending = thawing_period});
    store_.service_providers[provider].tokens_provisioned += tokens;

    emit_provision_created_event(
        store_, provider, verifier, tokens, max_verifier_cut, thawing_period);
    return outcome::success();
}

Result<void> ProvisionManager::add_to_provision(
    Address const &caller, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    BOOST_OUTCOME_TRY(check_authorized(caller, provider, verifier));
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    Provision *const prov = store_.find_provision(provider, verifier);
    if (HORIZON_UNLIKELY(!prov)) {
        return StakingError::ProvisionNotFound;
    }
    BOOST_OUTCOME_TRY(check_idle_stake(store_, provider, tokens));
    BOOST_OUTCOME_TRY(auto const new_tokens, checked_add(prov->tokens, tokens));

    prov->tokens = new_tokens;
    store_.service_providers[provider].tokens_provisioned += tokens;

    emit_provision_increased_event(store_, provider, verifier, tokens);
    return outcome::success();
}

Result<void> ProvisionManager::stake_to_provision(
    Address const &caller, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    BOOST_OUTCOME_TRY(check_authorized(caller, provider, verifier));
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    Provision *const prov = store_.find_provision(provider, verifier);
    if (HORIZON_UNLIKELY(!prov)) {
        return StakingError::ProvisionNotFound;
    }
    ServiceProvider &sp = store_.service_providers[provider];
    BOOST_OUTCOME_TRY(
        auto const tokens_staked, checked_add(sp.tokens_staked, tokens));
    BOOST_OUTCOME_TRY(auto const new_tokens, checked_add(prov->tokens, tokens));

    sp.tokens_staked = tokens_staked;
    sp.tokens_provisioned += tokens;
    prov->tokens = new_tokens;

    emit_stake_deposited_event(store_, provider, tokens);
    emit_provision_increased_event(store_, provider, verifier, tokens);
    return outcome::success();
}

Result<bytes32_t> ProvisionManager::thaw(
    Address const &caller, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    BOOST_OUTCOME_TRY(check_authorized(caller, provider, verifier));
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    Provision *const prov = store_.find_provision(provider, verifier);
    if (HORIZON_UNLIKELY(!prov)) {
        return StakingError::ProvisionNotFound;
    }
    if (HORIZON_UNLIKELY(prov->tokens - prov->tokens_thawing < tokens)) {
        return StakingError::InsufficientTokens;
    }

    ThawQueue queue{store_, prov->thaw_requests};
    BOOST_OUTCOME_TRY(
        auto const id,
        queue.enqueue(
            ThawRequestOwner{
                .type = ThawRequestType::Provision,
                .provider = provider,
                .verifier = verifier,
                .owner = provider},
            ThawingPool{
                .tokens_thawing = prov->tokens_thawing,
                .shares_thawing = prov->shares_thawing,
                .thawing_nonce = prov->thawing_nonce},
            tokens,
            prov->thawing_period));

    emit_provision_thawed_event(store_, provider, verifier, tokens);
    return id;
}

Result<void> ProvisionManager::deprovision(
    Address const &caller, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    BOOST_OUTCOME_TRY(check_authorized(caller, provider, verifier));
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    Provision *const prov = store_.find_provision(provider, verifier);
    if (HORIZON_UNLIKELY(!prov)) {
        return StakingError::ProvisionNotFound;
    }

    ThawQueue queue{store_, prov->thaw_requests};
    BOOST_OUTCOME_TRY(queue.fulfill_up_to(
        ThawingPool{
            .tokens_thawing = prov->tokens_thawing,
            .shares_thawing = prov->shares_thawing,
            .thawing_nonce = prov->thawing_nonce},
        tokens));

    prov->tokens -= tokens;
    store_.service_providers[provider].tokens_provisioned -= tokens;

    emit_tokens_deprovisioned_event(store_, provider, verifier, tokens);
    return outcome::success();
}

Result<void> ProvisionManager::reprovision(
    Address const &caller, Address const &provider,
    Address const &old_verifier, Address const &new_verifier,
    uint256_t const &tokens)
{
    BOOST_OUTCOME_TRY(check_authorized(caller, provider, old_verifier));
    BOOST_OUTCOME_TRY(check_authorized(caller, provider, new_verifier));
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    Provision *const from = store_.find_provision(provider, old_verifier);
    Provision *const to = store_.find_provision(provider, new_verifier);
    if (HORIZON_UNLIKELY(!from || !to)) {
        return StakingError::ProvisionNotFound;
    }
    BOOST_OUTCOME_TRY(checked_add(to->tokens, tokens));

    ThawQueue queue{store_, from->thaw_requests};
    BOOST_OUTCOME_TRY(queue.fulfill_up_to(
        ThawingPool{
            .tokens_thawing = from->tokens_thawing,
            .shares_thawing = from->shares_thawing,
            .thawing_nonce = from->thawing_nonce},
        tokens));

    from->tokens -= tokens;
    to->tokens += tokens;

    emit_tokens_deprovisioned_event(store_, provider, old_verifier, tokens);
    emit_provision_increased_event(store_, provider, new_verifier, tokens);
    return outcome::success();
}

Result<void> ProvisionManager::slash(
    Address const &verifier, Address const &provider, uint256_t const &tokens,
    uint256_t const &verifier_cut, Address const &verifier_cut_destination)
{
    Provision *const prov = store_.find_provision(provider, verifier);
    if (HORIZON_UNLIKELY(!prov)) {
        return StakingError::ProvisionNotFound;
    }
    auto const pool_it = store_.delegation_pools.find({provider, verifier});
    uint256_t const pool_tokens = pool_it == store_.delegation_pools.end()
                                      ? uint256_t{0}
                                      : pool_it->second.tokens;

    BOOST_OUTCOME_TRY(
        auto const tokens_total, checked_add(prov->tokens, pool_tokens));
    if (HORIZON_UNLIKELY(tokens_total == 0)) {
        return StakingError::NoTokensToSlash;
    }
    uint256_t const tokens_to_slash = std::min(tokens, tokens_total);
    uint256_t const provider_tokens_slashed =
        std::min(prov->tokens, tokens_to_slash);
    BOOST_OUTCOME_TRY(
        auto const max_cut,
        ppm_mul(provider_tokens_slashed, prov->max_verifier_cut));
    if (HORIZON_UNLIKELY(verifier_cut > max_cut)) {
        return StakingError::VerifierCutTooHigh;
    }

    if (provider_tokens_slashed > 0) {
        if (verifier_cut > 0) {
            store_.credit(verifier_cut_destination, verifier_cut);
            emit_verifier_tokens_sent_event(
                store_,
                provider,
                verifier,
                verifier_cut_destination,
                verifier_cut);
        }
        store_.burned += provider_tokens_slashed - verifier_cut;

        slash_thawing(
            prov->tokens,
            provider_tokens_slashed,
            prov->tokens_thawing,
            prov->shares_thawing,
            prov->thawing_nonce);
        prov->tokens -= provider_tokens_slashed;

        ServiceProvider &sp = store_.service_providers[provider];
        sp.tokens_provisioned -= provider_tokens_slashed;
        sp.tokens_staked -= provider_tokens_slashed;

        LOG_INFO(
            "Provision of {} for verifier {} slashed by {}, verifier cut {}",
            provider,
            verifier,
            provider_tokens_slashed,
            verifier_cut);
        emit_provision_slashed_event(
            store_, provider, verifier, provider_tokens_slashed);
    }

    uint256_t const delegation_tokens_to_slash =
        tokens_to_slash - provider_tokens_slashed;
    if (delegation_tokens_to_slash > 0) {
        if (store_.params.delegation_slashing_enabled) {
            DelegationPool &pool = pool_it->second;
            store_.burned += delegation_tokens_to_slash;
            slash_thawing(
                pool.tokens,
                delegation_tokens_to_slash,
                pool.tokens_thawing,
                pool.shares_thawing,
                pool.thawing_nonce);
            pool.tokens -= delegation_tokens_to_slash;

            LOG_INFO(
                "Delegation pool of {} for verifier {} slashed by {}",
                provider,
                verifier,
                delegation_tokens_to_slash);
            emit_delegation_slashed_event(
                store_, provider, verifier, delegation_tokens_to_slash);
        }
        else {
            LOG_WARNING(
                "Delegation slashing disabled, {} tokens of {} for verifier "
                "{} not slashed",
                delegation_tokens_to_slash,
                provider,
                verifier);
            emit_delegation_slashing_skipped_event(
                store_, provider, verifier, delegation_tokens_to_slash);
        }
    }
    return outcome::success();
}

Result<void> ProvisionManager::set_provision_parameters(
    Address const &caller, Address const &provider, Address const &verifier,
    uint32_t const max_verifier_cut, uint64_t const thawing_period)
{
    BOOST_OUTCOME_TRY(check_authorized(caller, provider, verifier));
    Provision *const prov = store_.find_provision(provider, verifier);
    if (HORIZON_UNLIKELY(!prov)) {
        return StakingError::ProvisionNotFound;
    }
    BOOST_OUTCOME_TRY(check_provision_parameters(
        store_.params, max_verifier_cut, thawing_period));

    prov->max_verifier_cut_pending = max_verifier_cut;
    prov->thawing_period_pending = thawing_period;

    emit_provision_parameters_staged_event(
        store_, provider, verifier, max_verifier_cut, thawing_period);
    return outcome::success();
}

Result<void> ProvisionManager::accept_provision_parameters(
    Address const &verifier, Address const &provider)
{
    Provision *const prov = store_.find_provision(provider, verifier);
    if (HORIZON_UNLIKELY(!prov)) {
        return StakingError::ProvisionNotFound;
    }

    prov->max_verifier_cut = prov->max_verifier_cut_pending;
    prov->thawing_period = prov->thawing_period_pending;

    emit_provision_parameters_set_event(
        store_,
        provider,
        verifier,
        prov->max_verifier_cut,
        prov->thawing_period);
    return outcome::success();
}

std::optional<Provision> ProvisionManager::get_provision(
    Address const &provider, Address const &verifier) const
{
    Provision const *const prov = store_.find_provision(provider, verifier);
    if (!prov) {
        return std::nullopt;
    }
    return *prov;
}

Result<uint256_t> ProvisionManager::get_tokens_available(
    Address const &provider, Address const &verifier) const
{
    Provision const *const prov = store_.find_provision(provider, verifier);
    if (!prov) {
        return uint256_t{0};
    }
    uint256_t const provider_tokens = prov->tokens - prov->tokens_thawing;

    DelegationPool const *const pool =
        store_.find_delegation_pool(provider, verifier);
    uint256_t const delegated =
        pool ? pool->tokens - pool->tokens_thawing : uint256_t{0};
    BOOST_OUTCOME_TRY(
        auto const delegated_max,
        checked_mul(provider_tokens, store_.params.delegation_ratio));

    return checked_add(provider_tokens, std::min(delegated, delegated_max));
}

Result<uint256_t> ProvisionManager::get_thawed_tokens(
    Address const &provider, Address const &verifier) const
{
    Provision const *const prov = store_.find_provision(provider, verifier);
    if (!prov) {
        return uint256_t{0};
    }
    return thawed_tokens(
        store_,
        prov->thaw_requests,
        prov->tokens_thawing,
        prov->shares_thawing,
        prov->thawing_nonce);
}

HORIZON_STAKING_NAMESPACE_END
