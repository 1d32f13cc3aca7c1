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
#include <horizon/core/result.hpp>
#include <horizon/staking/config.hpp>
#include <horizon/staking/types.hpp>
#include <horizon/staking/util/constants.hpp>

#include <cstdint>

HORIZON_STAKING_NAMESPACE_BEGIN

struct StakingStore;

// The thawing sub-pool a queue draws from. Requests hold shares of it.
struct ThawingPool
{
    uint256_t &tokens_thawing;
    uint256_t &shares_thawing;
    uint64_t thawing_nonce;
};

struct ThawRequestOwner
{
    ThawRequestType type;
    Address provider;
    Address verifier;
    Address owner;
};

bytes32_t thaw_request_id(ThawRequestOwner const &, uint64_t nonce);

// FIFO of thaw requests owned by one provision or one delegation. A request
// is releasable once `now >= thawing_until`. Scans always start at the head
// and stop at the first request still thawing.
class ThawQueue
{
    StakingStore &store_;
    ThawQueueState &state_;

    struct Step;

    Result<uint256_t> consume(
        ThawingPool const &, uint256_t const *limit,
        bool ignore_thawing_period);

public:
    ThawQueue(StakingStore &, ThawQueueState &);

    Result<bytes32_t> enqueue(
        ThawRequestOwner const &, ThawingPool const &, uint256_t const &tokens,
        uint64_t thawing_period);

    // Takes exactly `tokens` from released requests, splitting the last one
    // if needed. Fails without changing state when released requests do not
    // cover `tokens`.
    Result<uint256_t>
    fulfill_up_to(ThawingPool const &, uint256_t const &tokens);

    // Takes every released request.
    Result<uint256_t> collect_releasable(
        ThawingPool const &, bool ignore_thawing_period = false);

    uint32_t size() const
    {
        return state_.count;
    }
};

// Tokens `collect_releasable` would return, without dequeuing anything.
Result<uint256_t> thawed_tokens(
    StakingStore const &, ThawQueueState const &,
    uint256_t tokens_thawing, uint256_t shares_thawing,
    uint64_t thawing_nonce, bool ignore_thawing_period = false);

HORIZON_STAKING_NAMESPACE_END
