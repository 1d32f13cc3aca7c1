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
#include <horizon/core/checked_math.hpp>
#include <horizon/core/fmt/address_fmt.hpp> // NOLINT
#include <horizon/core/fmt/int_fmt.hpp> // NOLINT
#include <horizon/core/int.hpp>
#include <horizon/core/likely.h>
#include <horizon/staking/events.hpp>
#include <horizon/staking/staking.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/types.hpp>
#include <horizon/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

HORIZON_STAKING_NAMESPACE_BEGIN

HorizonStaking::HorizonStaking(
    StakingStore &store, Authorizer const &authorizer)
    : store_{store}
    , provisions_{store, authorizer}
    , delegations_{store}
    , legacy_{store}
{
}

Result<void>
HorizonStaking::stake(Address const &caller, uint256_t const &tokens)
{
    return stake_to(caller, caller, tokens);
}

Result<void> HorizonStaking::stake_to(
    Address const &, Address const &provider, uint256_t const &tokens)
{
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    auto const it = store_.service_providers.find(provider);
    uint256_t const staked =
        it == store_.service_providers.end() ? 0 : it->second.tokens_staked;
    BOOST_OUTCOME_TRY(auto const tokens_staked, checked_add(staked, tokens));

    store_.service_providers[provider].tokens_staked = tokens_staked;

    emit_stake_deposited_event(store_, provider, tokens);
    return outcome::success();
}

Result<void>
HorizonStaking::unstake(Address const &caller, uint256_t const &tokens)
{
    if (store_.params.thawing_period != 0) {
        return legacy_.lock(caller, tokens);
    }

    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    auto const it = store_.service_providers.find(caller);
    if (HORIZON_UNLIKELY(
            it == store_.service_providers.end() ||
            idle_stake(it->second) < tokens)) {
        return StakingError::InsufficientIdleStake;
    }

    it->second.tokens_staked -= tokens;
    store_.credit(caller, tokens);

    emit_stake_withdrawn_event(store_, caller, tokens);
    return outcome::success();
}

Result<uint256_t> HorizonStaking::withdraw(Address const &caller)
{
    return legacy_.withdraw(caller);
}

Result<void> HorizonStaking::migrate_stake_to_l2(
    Address const &caller, uint256_t const &tokens)
{
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    auto const it = store_.service_providers.find(caller);
    if (HORIZON_UNLIKELY(
            it == store_.service_providers.end() ||
            idle_stake(it->second) < tokens)) {
        return StakingError::InsufficientIdleStake;
    }

    ServiceProvider &sp = it->second;
    sp.tokens_staked -= tokens;
    sp.migrated = true;
    store_.bridged += tokens;

    LOG_INFO(
        "Stake of {} migrated to L2: {} tokens, {} left staked",
        caller,
        tokens,
        sp.tokens_staked);
    emit_stake_migrated_event(store_, caller, tokens);
    return outcome::success();
}

std::optional<ServiceProvider>
HorizonStaking::get_service_provider(Address const &provider) const
{
    auto const it = store_.service_providers.find(provider);
    if (it == store_.service_providers.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint256_t HorizonStaking::get_idle_stake(Address const &provider) const
{
    auto const it = store_.service_providers.find(provider);
    return it == store_.service_providers.end() ? uint256_t{0}
                                                : idle_stake(it->second);
}

HORIZON_STAKING_NAMESPACE_END
