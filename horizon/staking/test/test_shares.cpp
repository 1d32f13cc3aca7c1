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
#include <horizon/staking/authorizer.hpp>
#include <horizon/staking/delegation_manager.hpp>
#include <horizon/staking/staking.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/util/constants.hpp>
#include <horizon/staking/util/shares.hpp>
#include <horizon/staking/util/staking_error.hpp>

#include <gtest/gtest.h>

#include <array>

using namespace horizon;
using namespace horizon::staking;

TEST(Shares, issue_bootstraps_empty_pool)
{
    auto const res = issue_shares(0, 0, 5 * GRT);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 5 * GRT);
}

TEST(Shares, issue_at_exchange_rate)
{
    // 200 tokens back 100 shares
    auto const res = issue_shares(200, 100, 50);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 25);
}

TEST(Shares, issue_rounds_toward_pool)
{
    auto const res = issue_shares(3, 2, 2);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), 1);
}

TEST(Shares, issue_dust_is_rejected)
{
    auto const res = issue_shares(1000, 1, 999);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::ZeroShares);
}

TEST(Shares, issue_into_drained_pool)
{
    auto const res = issue_shares(0, 100, 50);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), StakingError::InvalidPoolState);
}

TEST(Shares, issue_overflow)
{
    auto const res = issue_shares(1, UINT256_MAX, 2);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MathError::Overflow);
}

TEST(Shares, redeem)
{
    EXPECT_EQ(redeem_shares(200, 100, 30).value(), 60);
    EXPECT_EQ(redeem_shares(10, 3, 1).value(), 3);
    EXPECT_EQ(redeem_shares(0, 0, 0).value(), 0);
}

TEST(Shares, shares_for_tokens_rounds_up)
{
    EXPECT_EQ(shares_for_tokens(10, 3, 3).value(), 1);
    EXPECT_EQ(shares_for_tokens(10, 3, 4).value(), 2);
    EXPECT_EQ(shares_for_tokens(10, 3, 10).value(), 3);
}

TEST(Shares, ppm_mul)
{
    EXPECT_EQ(ppm_mul(1'000'000, 250'000).value(), 250'000);
    EXPECT_EQ(ppm_mul(3, 500'000).value(), 1);
    EXPECT_EQ(ppm_mul(GRT, MAX_PPM).value(), GRT);
}

struct SharePool : public ::testing::Test
{
    StakingStore store;
    OperatorAllowlist authorizer;
    HorizonStaking staking{store, authorizer};

    Address const provider{0x100};
    Address const verifier{0x200};

    void SetUp() override
    {
        ASSERT_FALSE(staking.stake(provider, 10 * GRT).has_error());
        ASSERT_FALSE(staking.provisions()
                         .provision(provider, provider, verifier, 10 * GRT, 0, 0)
                         .has_error());
    }

    uint256_t pool_shares() const
    {
        return store.delegation_pools.at({provider, verifier}).shares;
    }
};

TEST_F(SharePool, holder_shares_sum_to_pool_shares)
{
    std::array<Address, 3> const delegators{
        Address{0x301}, Address{0x302}, Address{0x303}};
    DelegationManager &delegations = staking.delegations();

    ASSERT_FALSE(
        delegations.delegate(delegators[0], provider, verifier, 3 * GRT)
            .has_error());
    ASSERT_FALSE(
        delegations
            .add_to_delegation_pool(delegators[2], provider, verifier, GRT + 1)
            .has_error());
    ASSERT_FALSE(
        delegations.delegate(delegators[1], provider, verifier, 7 * GRT + 3)
            .has_error());
    ASSERT_FALSE(delegations
                     .undelegate(
                         delegators[0],
                         provider,
                         verifier,
                         delegations.get_delegated_shares(
                             provider, verifier, delegators[0]) /
                             3)
                     .has_error());
    ASSERT_FALSE(
        delegations.delegate(delegators[2], provider, verifier, 2 * GRT + 11)
            .has_error());
    ASSERT_FALSE(delegations.undelegate(delegators[1], provider, verifier, 17)
                     .has_error());

    uint256_t sum{0};
    for (auto const &[_, delegation] :
         store.delegation_pools.at({provider, verifier}).delegators) {
        sum += delegation.shares;
    }
    EXPECT_EQ(sum, pool_shares());
}

TEST_F(SharePool, round_trips_never_create_tokens)
{
    Address const holder{0x301};
    Address const cycler{0x302};
    DelegationManager &delegations = staking.delegations();

    ASSERT_FALSE(
        delegations.delegate(holder, provider, verifier, 10 * GRT).has_error());
    ASSERT_FALSE(
        delegations.add_to_delegation_pool(holder, provider, verifier, 3 * GRT)
            .has_error());
    uint256_t const holder_shares =
        delegations.get_delegated_shares(provider, verifier, holder);

    uint256_t deposited{0};
    for (int i = 0; i < 5; ++i) {
        uint256_t const tokens = GRT + 7;
        auto const shares =
            delegations.delegate(cycler, provider, verifier, tokens);
        ASSERT_TRUE(shares.has_value());
        deposited += tokens;
        ASSERT_FALSE(
            delegations.undelegate(cycler, provider, verifier, shares.value())
                .has_error());
        ASSERT_TRUE(
            delegations.withdraw_delegated(cycler, provider, verifier)
                .has_value());
    }

    EXPECT_LE(store.withdrawn[cycler], deposited);
    EXPECT_EQ(delegations.get_delegated_shares(provider, verifier, cycler), 0);

    auto const &pool = store.delegation_pools.at({provider, verifier});
    auto const holder_value = redeem_shares(
        pool.tokens - pool.tokens_thawing, pool.shares, holder_shares);
    ASSERT_TRUE(holder_value.has_value());
    EXPECT_GE(holder_value.value(), 13 * GRT);
}
