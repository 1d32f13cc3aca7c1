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
#include <horizon/core/contract/events.hpp>
#include <horizon/core/int.hpp>
#include <horizon/staking/config.hpp>
#include <horizon/staking/types.hpp>

#include <cstdint>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

HORIZON_STAKING_NAMESPACE_BEGIN

using ProvisionKey = std::pair<Address, Address>;

// All staking state. Mutated only through the managers, one call at a time.
struct StakingStore
{
    uint64_t now{0};
    StakingParams params{};

    std::map<Address, ServiceProvider> service_providers{};
    std::map<ProvisionKey, Provision> provisions{};
    std::map<ProvisionKey, DelegationPool> delegation_pools{};
    std::unordered_map<bytes32_t, ThawRequest> thaw_requests{};

    // token movements out of the staking ledger
    std::map<Address, uint256_t> withdrawn{};
    uint256_t burned{0};
    uint256_t bridged{0};

    std::vector<LogEntry> events{};

    void emit_log(LogEntry const &event)
    {
        events.push_back(event);
    }

    void credit(Address const &to, uint256_t const &tokens)
    {
        withdrawn[to] += tokens;
    }

    Provision *find_provision(Address const &provider, Address const &verifier)
    {
        auto const it = provisions.find({provider, verifier});
        return it == provisions.end() ? nullptr : &it->second;
    }

    Provision const *
    find_provision(Address const &provider, Address const &verifier) const
    {
        auto const it = provisions.find({provider, verifier});
        return it == provisions.end() ? nullptr : &it->second;
    }

    DelegationPool const *
    find_delegation_pool(Address const &provider, Address const &verifier) const
    {
        auto const it = delegation_pools.find({provider, verifier});
        return it == delegation_pools.end() ? nullptr : &it->second;
    }
};

HORIZON_STAKING_NAMESPACE_END
