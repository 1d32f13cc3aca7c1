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
#include <horizon/core/int.hpp>
#include <horizon/core/likely.h>
#include <horizon/staking/events.hpp>
#include <horizon/staking/legacy_extension.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/types.hpp>
#include <horizon/staking/util/staking_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstdint>

HORIZON_STAKING_ANONYMOUS_NAMESPACE_BEGIN

Result<uint256_t> weighted_average_rounding_up(
    uint256_t const &value1, uint256_t const &weight1,
    uint256_t const &value2, uint256_t const &weight2)
{
    BOOST_OUTCOME_TRY(auto const a, checked_mul(value1, weight1));
    BOOST_OUTCOME_TRY(auto const b, checked_mul(value2, weight2));
    BOOST_OUTCOME_TRY(auto const sum, checked_add(a, b));
    BOOST_OUTCOME_TRY(auto const total, checked_add(weight1, weight2));
    BOOST_OUTCOME_TRY(auto const rounded, checked_add(sum, total - 1));
    return checked_div(rounded, total);
}

HORIZON_STAKING_ANONYMOUS_NAMESPACE_END

HORIZON_STAKING_NAMESPACE_BEGIN

LegacyOperationsExtension::LegacyOperationsExtension(StakingStore &store)
    : store_{store}
{
}

Result<void> LegacyOperationsExtension::lock(
    Address const &provider, uint256_t const &tokens)
{
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    auto const it = store_.service_providers.find(provider);
    if (HORIZON_UNLIKELY(
            it == store_.service_providers.end() ||
            idle_stake(it->second) < tokens)) {
        return StakingError::InsufficientIdleStake;
    }
    ServiceProvider &sp = it->second;

    uint256_t locked = sp.tokens_locked;
    uint64_t period = store_.params.thawing_period;
    bool const expired =
        locked > 0 && store_.now >= sp.tokens_locked_until;
    if (locked > 0 && !expired) {
        uint64_t const remaining = sp.tokens_locked_until - store_.now;
        BOOST_OUTCOME_TRY(
            auto const average,
            weighted_average_rounding_up(remaining, locked, period, tokens));
        period = static_cast<uint64_t>(average);
    }

    if (expired) {
        BOOST_OUTCOME_TRY(withdraw(provider));
        locked = 0;
    }
    sp.tokens_locked = locked + tokens;
    sp.tokens_locked_until = store_.now + period;

    emit_stake_locked_event(
        store_, provider, sp.tokens_locked, sp.tokens_locked_until);
    return outcome::success();
}

Result<uint256_t> LegacyOperationsExtension::withdraw(Address const &provider)
{
    auto const it = store_.service_providers.find(provider);
    if (HORIZON_UNLIKELY(
            it == store_.service_providers.end() ||
            it->second.tokens_locked == 0)) {
        return StakingError::NoLockedTokens;
    }
    ServiceProvider &sp = it->second;
    if (HORIZON_UNLIKELY(store_.now < sp.tokens_locked_until)) {
        return StakingError::StillThawing;
    }

    uint256_t const tokens = sp.tokens_locked;
    sp.tokens_staked -= tokens;
    sp.tokens_locked = 0;
    sp.tokens_locked_until = 0;
    store_.credit(provider, tokens);

    emit_legacy_stake_withdrawn_event(store_, provider, tokens);
    return tokens;
}

HORIZON_STAKING_NAMESPACE_END
