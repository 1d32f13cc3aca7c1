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

#include <cstdint>
#include <optional>

HORIZON_STAKING_NAMESPACE_BEGIN

class Authorizer;
struct StakingStore;

class ProvisionManager
{
    StakingStore &store_;
    Authorizer const &authorizer_;

    Result<void> check_authorized(
        Address const &caller, Address const &provider,
        Address const &verifier) const;

public:
    ProvisionManager(StakingStore &, Authorizer const &);

    Result<void> provision(
        Address const &caller, Address const &provider,
        Address const &verifier, uint256_t const &tokens,
        uint32_t max_verifier_cut, uint64_t thawing_period);

    Result<void> add_to_provision(
        Address const &caller, Address const &provider,
        Address const &verifier, uint256_t const &tokens);

    // Deposits `tokens` as stake and adds them to an existing provision.
    Result<void> stake_to_provision(
        Address const &caller, Address const &provider,
        Address const &verifier, uint256_t const &tokens);

    Result<bytes32_t> thaw(
        Address const &caller, Address const &provider,
        Address const &verifier, uint256_t const &tokens);

    Result<void> deprovision(
        Address const &caller, Address const &provider,
        Address const &verifier, uint256_t const &tokens);

    Result<void> reprovision(
        Address const &caller, Address const &provider,
        Address const &old_verifier, Address const &new_verifier,
        uint256_t const &tokens);

    // The caller is the verifier of the slashed provision. Tokens beyond the
    // provision are taken from the delegation pool when delegation slashing
    // is enabled and skipped otherwise.
    Result<void> slash(
        Address const &verifier, Address const &provider,
        uint256_t const &tokens, uint256_t const &verifier_cut,
        Address const &verifier_cut_destination);

    Result<void> set_provision_parameters(
        Address const &caller, Address const &provider,
        Address const &verifier, uint32_t max_verifier_cut,
        uint64_t thawing_period);

    Result<void>
    accept_provision_parameters(
        Address const &verifier, Address const &provider);

    std::optional<Provision>
    get_provision(Address const &provider, Address const &verifier) const;

    // Provider tokens not thawing plus delegated tokens up to
    // `delegation_ratio` times that.
    Result<uint256_t>
    get_tokens_available(
        Address const &provider, Address const &verifier) const;

    Result<uint256_t>
    get_thawed_tokens(Address const &provider, Address const &verifier) const;
};

HORIZON_STAKING_NAMESPACE_END
