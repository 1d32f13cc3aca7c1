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
#include <horizon/core/int.hpp>
#include <horizon/staking/authorizer.hpp>
#include <horizon/staking/delegation_manager.hpp>
#include <horizon/staking/staking.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/util/constants.hpp>
#include <horizon/staking/util/staking_error.hpp>

#include <gtest/gtest.h>

using namespace horizon;
using namespace horizon::staking;

struct Delegating : public ::testing::Test
{
    StakingStore store;
    OperatorAllowlist authorizer;
    HorizonStaking staking{store, authorizer};
    DelegationManager &delegations = staking.delegations();

    Address const provider{0x100};
    Address const other_provider{0x101};
    Address const verifier{0x200};
    Address const delegator{0x300};

    void SetUp() override
    {
        for (Address const &sp : {provider, other_provider}) {
            ASSERT_FALSE(staking.stake(sp, 10 * GRT).has_error());
            ASSERT_FALSE(staking.provisions()
                             .provision(sp, sp, verifier, 10 * GRT, 0, 100)
                             .has_error());
        }
    }

    DelegationPool const &pool(Address const &sp) const
    {
        return store.delegation_pools.at({sp, verifier});
    }
};

TEST_F(Delegating, delegate_requirements)
{
    EXPECT_EQ(
        delegations.delegate(delegator, provider, verifier, GRT - 1)
            .assume_error(),
        StakingError::MinimumDelegation);
    EXPECT_EQ(
        delegations.delegate(delegator, provider, Address{0x201}, GRT)
            .assume_error(),
        StakingError::ProvisionNotFound);
    EXPECT_TRUE(store.delegation_pools.empty());

    auto const shares = delegations.delegate(delegator, provider, verifier, GRT);
    ASSERT_TRUE(shares.has_value());
    EXPECT_EQ(shares.value(), GRT);
    EXPECT_EQ(pool(provider).tokens, GRT);
    EXPECT_EQ(pool(provider).shares, GRT);
    EXPECT_EQ(
        delegations.get_delegated_shares(provider, verifier, delegator), GRT);
}

TEST_F(Delegating, undelegate_and_withdraw)
{
    ASSERT_TRUE(delegations.delegate(delegator, provider, verifier, 10 * GRT));

    EXPECT_EQ(
        delegations.undelegate(delegator, provider, verifier, 0).assume_error(),
        StakingError::InvalidZeroShares);
    EXPECT_EQ(
        delegations.undelegate(delegator, provider, verifier, 10 * GRT + 1)
            .assume_error(),
        StakingError::InsufficientShares);
    EXPECT_EQ(
        delegations.undelegate(Address{0x301}, provider, verifier, 1)
            .assume_error(),
        StakingError::InsufficientShares);

    ASSERT_TRUE(delegations.undelegate(delegator, provider, verifier, 4 * GRT));
    EXPECT_EQ(pool(provider).shares, 6 * GRT);
    EXPECT_EQ(pool(provider).tokens, 10 * GRT);
    EXPECT_EQ(pool(provider).tokens_thawing, 4 * GRT);

    store.now = 99;
    auto withdrawn = delegations.withdraw_delegated(delegator, provider, verifier);
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 0);

    store.now = 100;
    withdrawn = delegations.withdraw_delegated(delegator, provider, verifier);
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 4 * GRT);
    EXPECT_EQ(store.withdrawn[delegator], 4 * GRT);
    EXPECT_EQ(pool(provider).tokens, 6 * GRT);
    EXPECT_EQ(pool(provider).tokens_thawing, 0);

    withdrawn = delegations.withdraw_delegated(delegator, provider, verifier);
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 0);
}

TEST_F(Delegating, withdraw_collects_every_released_request)
{
    ASSERT_TRUE(delegations.delegate(delegator, provider, verifier, 10 * GRT));
    ASSERT_TRUE(delegations.undelegate(delegator, provider, verifier, GRT));
    store.now = 50;
    ASSERT_TRUE(delegations.undelegate(delegator, provider, verifier, 2 * GRT));
    store.now = 120;
    ASSERT_TRUE(delegations.undelegate(delegator, provider, verifier, 3 * GRT));

    store.now = 150;
    auto const withdrawn =
        delegations.withdraw_delegated(delegator, provider, verifier);
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 3 * GRT);
    EXPECT_EQ(
        store.delegation_pools.at({provider, verifier})
            .delegators.at(delegator)
            .thaw_requests.count,
        1);
}

TEST_F(Delegating, redelegate_to_another_pool)
{
    ASSERT_TRUE(delegations.delegate(delegator, provider, verifier, 10 * GRT));
    ASSERT_TRUE(delegations.undelegate(delegator, provider, verifier, 5 * GRT));

    store.now = 100;
    RedelegateTarget const target{
        .provider = other_provider, .verifier = verifier};
    auto const moved = delegations.withdraw_delegated(
        delegator, provider, verifier, target);
    ASSERT_TRUE(moved.has_value());
    EXPECT_EQ(moved.value(), 5 * GRT);

    EXPECT_EQ(store.withdrawn[delegator], 0);
    EXPECT_EQ(pool(provider).tokens, 5 * GRT);
    EXPECT_EQ(pool(other_provider).tokens, 5 * GRT);
    EXPECT_EQ(
        delegations.get_delegated_shares(other_provider, verifier, delegator),
        5 * GRT);
}

TEST_F(Delegating, redelegate_keeps_minimum_delegation)
{
    ASSERT_TRUE(delegations.delegate(delegator, provider, verifier, 10 * GRT));
    ASSERT_TRUE(delegations.undelegate(delegator, provider, verifier, GRT / 2));

    store.now = 100;
    RedelegateTarget const target{
        .provider = other_provider, .verifier = verifier};
    EXPECT_EQ(
        delegations.withdraw_delegated(delegator, provider, verifier, target)
            .assume_error(),
        StakingError::MinimumDelegation);
    EXPECT_EQ(pool(provider).tokens_thawing, GRT / 2);
    EXPECT_EQ(
        pool(provider).delegators.at(delegator).thaw_requests.count, 1);
}

TEST_F(Delegating, provider_leaving_releases_delegators)
{
    ASSERT_TRUE(
        staking.provisions().thaw(provider, provider, verifier, 10 * GRT));
    ASSERT_TRUE(delegations.delegate(delegator, provider, verifier, 10 * GRT));

    store.now = 100;
    ASSERT_TRUE(delegations.undelegate(delegator, provider, verifier, 10 * GRT));
    ASSERT_FALSE(staking.provisions()
                     .deprovision(provider, provider, verifier, 10 * GRT)
                     .has_error());

    auto withdrawn = delegations.withdraw_delegated(delegator, provider, verifier);
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 0);

    ASSERT_FALSE(staking.migrate_stake_to_l2(provider, 10 * GRT).has_error());
    auto const sp = staking.get_service_provider(provider);
    ASSERT_TRUE(sp.has_value());
    EXPECT_TRUE(sp->migrated);
    EXPECT_EQ(sp->tokens_staked, 0);
    EXPECT_EQ(store.bridged, 10 * GRT);

    withdrawn = delegations.withdraw_delegated(delegator, provider, verifier);
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 10 * GRT);
    EXPECT_EQ(store.withdrawn[delegator], 10 * GRT);
}

TEST_F(Delegating, add_to_delegation_pool)
{
    EXPECT_EQ(
        delegations.add_to_delegation_pool(delegator, provider, verifier, GRT)
            .assume_error(),
        StakingError::InvalidPoolState);
    EXPECT_EQ(
        delegations.add_to_delegation_pool(delegator, provider, verifier, 0)
            .assume_error(),
        StakingError::InvalidZeroTokens);

    ASSERT_TRUE(delegations.delegate(delegator, provider, verifier, 2 * GRT));
    ASSERT_FALSE(
        delegations.add_to_delegation_pool(Address{0xfee}, provider, verifier, GRT)
            .has_error());
    EXPECT_EQ(pool(provider).tokens, 3 * GRT);
    EXPECT_EQ(pool(provider).shares, 2 * GRT);

    ASSERT_TRUE(delegations.undelegate(delegator, provider, verifier, 2 * GRT));
    store.now = 100;
    auto const withdrawn =
        delegations.withdraw_delegated(delegator, provider, verifier);
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 3 * GRT);
}

TEST(Stake, unstake_without_lock)
{
    StakingStore store;
    OperatorAllowlist authorizer;
    HorizonStaking staking{store, authorizer};
    Address const provider{0x100};

    EXPECT_EQ(
        staking.stake(provider, 0).assume_error(),
        StakingError::InvalidZeroTokens);
    ASSERT_FALSE(staking.stake(provider, 5 * GRT).has_error());
    EXPECT_EQ(
        staking.unstake(provider, 6 * GRT).assume_error(),
        StakingError::InsufficientIdleStake);
    ASSERT_FALSE(staking.unstake(provider, 2 * GRT).has_error());

    EXPECT_EQ(staking.get_idle_stake(provider), 3 * GRT);
    EXPECT_EQ(store.withdrawn[provider], 2 * GRT);
}

TEST(Stake, legacy_lock_and_withdraw)
{
    StakingStore store;
    store.params.thawing_period = 100;
    OperatorAllowlist authorizer;
    HorizonStaking staking{store, authorizer};
    Address const provider{0x100};

    EXPECT_EQ(
        staking.withdraw(provider).assume_error(), StakingError::NoLockedTokens);
    ASSERT_FALSE(staking.stake(provider, 10 * GRT).has_error());
    ASSERT_FALSE(staking.unstake(provider, 4 * GRT).has_error());

    auto sp = staking.get_service_provider(provider);
    ASSERT_TRUE(sp.has_value());
    EXPECT_EQ(sp->tokens_locked, 4 * GRT);
    EXPECT_EQ(sp->tokens_locked_until, 100);
    EXPECT_EQ(staking.get_idle_stake(provider), 6 * GRT);

    // 50 left on 4 GRT and 100 on 4 more average to 75
    store.now = 50;
    ASSERT_FALSE(staking.unstake(provider, 4 * GRT).has_error());
    sp = staking.get_service_provider(provider);
    EXPECT_EQ(sp->tokens_locked, 8 * GRT);
    EXPECT_EQ(sp->tokens_locked_until, 125);

    store.now = 124;
    EXPECT_EQ(
        staking.withdraw(provider).assume_error(), StakingError::StillThawing);

    store.now = 125;
    auto const withdrawn = staking.withdraw(provider);
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 8 * GRT);
    EXPECT_EQ(store.withdrawn[provider], 8 * GRT);
    EXPECT_EQ(staking.get_service_provider(provider)->tokens_staked, 2 * GRT);
}

TEST(Stake, legacy_lock_withdraws_expired_tokens_first)
{
    StakingStore store;
    store.params.thawing_period = 100;
    OperatorAllowlist authorizer;
    HorizonStaking staking{store, authorizer};
    Address const provider{0x100};

    ASSERT_FALSE(staking.stake(provider, 10 * GRT).has_error());
    ASSERT_FALSE(staking.unstake(provider, 4 * GRT).has_error());

    store.now = 200;
    ASSERT_FALSE(staking.unstake(provider, GRT).has_error());
    auto const sp = staking.get_service_provider(provider);
    ASSERT_TRUE(sp.has_value());
    EXPECT_EQ(sp->tokens_staked, 6 * GRT);
    EXPECT_EQ(sp->tokens_locked, GRT);
    EXPECT_EQ(sp->tokens_locked_until, 300);
    EXPECT_EQ(store.withdrawn[provider], 4 * GRT);
}
