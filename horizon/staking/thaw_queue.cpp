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
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/checked_math.hpp>
#include <horizon/core/contract/abi_encode.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/core/likely.h>
#include <horizon/staking/events.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/thaw_queue.hpp>
#include <horizon/staking/util/constants.hpp>
#include <horizon/staking/util/shares.hpp>
#include <horizon/staking/util/staking_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <vector>

HORIZON_STAKING_NAMESPACE_BEGIN

bytes32_t thaw_request_id(ThawRequestOwner const &owner, uint64_t const nonce)
{
    byte_string input;
    input.push_back(static_cast<uint8_t>(owner.type));
    input += to_byte_string_view(owner.provider.bytes);
    input += to_byte_string_view(owner.verifier.bytes);
    input += to_byte_string_view(owner.owner.bytes);
    input += to_byte_string_view(abi_encode_uint(nonce).bytes);
    return to_bytes(keccak256(input));
}

struct ThawQueue::Step
{
    bytes32_t id;
    uint256_t tokens;
    uint256_t shares;
    uint64_t thawing_until;
    bool valid;
    bool removed;
};

ThawQueue::ThawQueue(StakingStore &store, ThawQueueState &state)
    : store_{store}
    , state_{state}
{
}

Result<bytes32_t> ThawQueue::enqueue(
    ThawRequestOwner const &owner, ThawingPool const &pool,
    uint256_t const &tokens, uint64_t const thawing_period)
{
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    if (HORIZON_UNLIKELY(state_.count >= MAX_THAW_REQUESTS)) {
        return StakingError::TooManyThawRequests;
    }

    BOOST_OUTCOME_TRY(
        auto const shares,
        issue_shares(pool.tokens_thawing, pool.shares_thawing, tokens));
    BOOST_OUTCOME_TRY(
        auto const tokens_thawing, checked_add(pool.tokens_thawing, tokens));
    BOOST_OUTCOME_TRY(
        auto const shares_thawing, checked_add(pool.shares_thawing, shares));

    uint64_t const thawing_until = store_.now + thawing_period;
    bytes32_t const id = thaw_request_id(owner, state_.nonce);
    HORIZON_ASSERT(!store_.thaw_requests.contains(id));

    store_.thaw_requests.emplace(
        id,
        ThawRequest{
            .shares = shares,
            .thawing_until = thawing_until,
            .next = bytes32_t{},
            .thawing_nonce = pool.thawing_nonce});
    if (state_.count == 0) {
        state_.head = id;
    }
    else {
        store_.thaw_requests.at(state_.tail).next = id;
    }
    state_.tail = id;
    ++state_.nonce;
    ++state_.count;

    pool.tokens_thawing = tokens_thawing;
    pool.shares_thawing = shares_thawing;

    emit_thaw_request_created_event(
        store_,
        owner.provider,
        owner.verifier,
        owner.owner,
        shares,
        thawing_until,
        id);
    return id;
}

Result<uint256_t> ThawQueue::consume(
    ThawingPool const &pool, uint256_t const *const limit,
    bool const ignore_thawing_period)
{
    uint256_t tokens_thawing = pool.tokens_thawing;
    uint256_t shares_thawing = pool.shares_thawing;
    uint256_t remaining = limit ? *limit : uint256_t{0};
    uint256_t total{0};
    std::vector<Step> steps;

    bytes32_t id = state_.head;
    for (uint32_t i = 0; i < state_.count; ++i) {
        if (limit && remaining == 0) {
            break;
        }
        ThawRequest const &request = store_.thaw_requests.at(id);
        if (!ignore_thawing_period && store_.now < request.thawing_until) {
            break;
        }

        // requests issued before the sub-pool was slashed to zero are void
        bool const valid = request.thawing_nonce == pool.thawing_nonce;
        Step step{
            .id = id,
            .tokens = 0,
            .shares = request.shares,
            .thawing_until = request.thawing_until,
            .valid = valid,
            .removed = true};
        if (valid) {
            BOOST_OUTCOME_TRY(
                step.tokens,
                redeem_shares(tokens_thawing, shares_thawing, request.shares));
            if (limit && step.tokens > remaining) {
                BOOST_OUTCOME_TRY(
                    auto const burned,
                    shares_for_tokens(
                        tokens_thawing, shares_thawing, remaining));
                step.tokens = remaining;
                step.shares = burned;
                step.removed = burned == request.shares;
            }
            tokens_thawing -= step.tokens;
            shares_thawing -= step.shares;
            total += step.tokens;
            if (limit) {
                remaining -= step.tokens;
            }
        }
        steps.push_back(step);
        if (!step.removed) {
            break;
        }
        id = request.next;
    }

    if (limit && remaining != 0) {
        return StakingError::InsufficientThawedTokens;
    }

    for (Step const &step : steps) {
        if (step.removed) {
            auto const node = store_.thaw_requests.find(step.id);
            HORIZON_ASSERT(node != store_.thaw_requests.end());
            state_.head = node->second.next;
            store_.thaw_requests.erase(node);
            --state_.count;
        }
        else {
            store_.thaw_requests.at(step.id).shares -= step.shares;
        }
        emit_thaw_request_fulfilled_event(
            store_,
            step.id,
            step.tokens,
            step.shares,
            step.thawing_until,
            step.valid);
    }
    if (state_.count == 0) {
        state_.head = bytes32_t{};
        state_.tail = bytes32_t{};
    }

    pool.tokens_thawing = tokens_thawing;
    pool.shares_thawing = shares_thawing;
    return total;
}

Result<uint256_t>
ThawQueue::fulfill_up_to(ThawingPool const &pool, uint256_t const &tokens)
{
    if (HORIZON_UNLIKELY(tokens == 0)) {
        return StakingError::InvalidZeroTokens;
    }
    return consume(pool, &tokens, false);
}

Result<uint256_t> ThawQueue::collect_releasable(
    ThawingPool const &pool, bool const ignore_thawing_period)
{
    return consume(pool, nullptr, ignore_thawing_period);
}

Result<uint256_t> thawed_tokens(
    StakingStore const &store, ThawQueueState const &state,
    uint256_t tokens_thawing, uint256_t shares_thawing,
    uint64_t const thawing_nonce, bool const ignore_thawing_period)
{
    uint256_t total{0};

    bytes32_t id = state.head;
    for (uint32_t i = 0; i < state.count; ++i) {
        ThawRequest const &request = store.thaw_requests.at(id);
        if (!ignore_thawing_period && store.now < request.thawing_until) {
            break;
        }
        if (request.thawing_nonce == thawing_nonce) {
            BOOST_OUTCOME_TRY(
                auto const tokens,
                redeem_shares(tokens_thawing, shares_thawing, request.shares));
            tokens_thawing -= tokens;
            shares_thawing -= request.shares;
            total += tokens;
        }
        id = request.next;
    }
    return total;
}

HORIZON_STAKING_NAMESPACE_END
