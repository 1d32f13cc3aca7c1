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

HORIZON_STAKING_NAMESPACE_BEGIN

struct StakingStore;

// Deprecated unstake path: idle stake is locked for the legacy thawing
// period as a whole and withdrawn in one go once the lock expires.
class LegacyOperationsExtension
{
    StakingStore &store_;

public:
    explicit LegacyOperationsExtension(StakingStore &);

    // Locks `tokens` more. Already locked tokens that have expired are
    // withdrawn first, otherwise the lock period becomes the token-weighted
    // average of the remaining and the new period, rounded up.
    Result<void> lock(Address const &provider, uint256_t const &tokens);

    Result<uint256_t> withdraw(Address const &provider);
};

HORIZON_STAKING_NAMESPACE_END
