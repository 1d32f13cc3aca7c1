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
#include <horizon/core/int.hpp>
#include <horizon/core/result.hpp>
#include <horizon/staking/config.hpp>
#include <horizon/staking/delegation_manager.hpp>
#include <horizon/staking/legacy_extension.hpp>
#include <horizon/staking/provision_manager.hpp>
#include <horizon/staking/types.hpp>

#include <optional>

HORIZON_STAKING_NAMESPACE_BEGIN

class Authorizer;
struct StakingStore;

// Service provider stake, with provisioning, delegation and the deprecated
// lock path composed in.
class HorizonStaking
{
    StakingStore &store_;
    ProvisionManager provisions_;
    DelegationManager delegations_;
    LegacyOperationsExtension legacy_;

public:
    HorizonStaking(StakingStore &, Authorizer const &);

    Result<void> stake(Address const &caller, uint256_t const &tokens);

    Result<void> stake_to(
        Address const &caller, Address const &provider,
        uint256_t const &tokens);

    // Withdraws idle stake at once, or locks it when the legacy thawing
    // period is set.
    Result<void> unstake(Address const &caller, uint256_t const &tokens);

    Result<uint256_t> withdraw(Address const &caller);

    // Moves idle stake to the other chain and marks the provider migrated.
    Result<void>
    migrate_stake_to_l2(Address const &caller, uint256_t const &tokens);

    std::optional<ServiceProvider>
    get_service_provider(Address const &provider) const;

    uint256_t get_idle_stake(Address const &provider) const;

    ProvisionManager &provisions()
    {
        return provisions_;
    }

    DelegationManager &delegations()
    {
        return delegations_;
    }

    LegacyOperationsExtension &legacy()
    {
        return legacy_;
    }
};

HORIZON_STAKING_NAMESPACE_END
