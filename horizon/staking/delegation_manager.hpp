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

#include <optional>

HORIZON_STAKING_NAMESPACE_BEGIN

struct StakingStore;

struct RedelegateTarget
{
    Address provider;
    Address verifier;
};

class DelegationManager
{
    StakingStore &store_;

    Result<uint256_t> preview_delegate(
        Address const &provider, Address const &verifier,
        uint256_t const &tokens) const;

    void apply_delegate(
        Address const &delegator, Address const &provider,
        Address const &verifier, uint256_t const &tokens,
        uint256_t const &shares);

public:
    explicit DelegationManager(StakingStore &);

    Result<uint256_t> delegate(
        Address const &caller, Address const &provider,
        Address const &verifier, uint256_t const &tokens);

    Result<bytes32_t> undelegate(
        Address const &caller, Address const &provider,
        Address const &verifier, uint256_t const &shares);

    // Collects every released thaw request of the caller and either pays the
    // tokens out or delegates them to `target`. Returns the tokens collected.
    Result<uint256_t> withdraw_delegated(
        Address const &caller, Address const &provider,
        Address const &verifier,
        std::optional<RedelegateTarget> const &target = std::nullopt);

    // Adds tokens to the pool without minting shares.
    Result<void> add_to_delegation_pool(
        Address const &caller, Address const &provider,
        Address const &verifier, uint256_t const &tokens);

    uint256_t get_delegated_shares(
        Address const &provider, Address const &verifier,
        Address const &delegator) const;
};

HORIZON_STAKING_NAMESPACE_END
