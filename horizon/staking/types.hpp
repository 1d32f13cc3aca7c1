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
#include <horizon/staking/util/constants.hpp>

#include <cstdint>
#include <map>

HORIZON_STAKING_NAMESPACE_BEGIN

// Head and tail link into the store's thaw request table. A zero id marks
// an empty queue.
struct ThawQueueState
{
    bytes32_t head{};
    bytes32_t tail{};
    uint64_t nonce{0};
    uint32_t count{0};

    friend bool
    operator==(ThawQueueState const &, ThawQueueState const &) = default;
};

struct ThawRequest
{
    uint256_t shares{0};
    uint64_t thawing_until{0};
    bytes32_t next{};
    uint64_t thawing_nonce{0};
};

struct Provision
{
    uint256_t tokens{0};
    uint256_t tokens_thawing{0};
    uint256_t shares_thawing{0};
    uint32_t max_verifier_cut{0};
    uint64_t thawing_period{0};
    uint64_t created_at{0};
    uint32_t max_verifier_cut_pending{0};
    uint64_t thawing_period_pending{0};
    uint64_t thawing_nonce{0};
    ThawQueueState thaw_requests{};
};

struct ServiceProvider
{
    uint256_t tokens_staked{0};
    uint256_t tokens_provisioned{0};
    uint256_t tokens_locked{0};
    uint64_t tokens_locked_until{0};
    bool migrated{false};
};

struct Delegation
{
    uint256_t shares{0};
    ThawQueueState thaw_requests{};
};

struct DelegationPool
{
    uint256_t tokens{0};
    uint256_t shares{0};
    uint256_t tokens_thawing{0};
    uint256_t shares_thawing{0};
    uint64_t thawing_nonce{0};
    std::map<Address, Delegation> delegators{};
};

struct StakingParams
{
    uint64_t max_thawing_period{DEFAULT_MAX_THAWING_PERIOD};
    bool delegation_slashing_enabled{false};
    uint32_t delegation_ratio{DEFAULT_DELEGATION_RATIO};
    // Lock period of the deprecated unstake path. Zero withdraws at once.
    uint64_t thawing_period{0};
};

inline uint256_t idle_stake(ServiceProvider const &sp)
{
    uint256_t const committed = sp.tokens_provisioned + sp.tokens_locked;
    return sp.tokens_staked > committed ? sp.tokens_staked - committed : 0;
}

HORIZON_STAKING_NAMESPACE_END
