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

#include <horizon/core/int.hpp>
#include <horizon/core/result.hpp>
#include <horizon/staking/config.hpp>

#include <cstdint>

HORIZON_STAKING_NAMESPACE_BEGIN

// Shares minted for `tokens` deposited into a pool whose `pool_shares` are
// backed by `pool_tokens`. An empty pool is bootstrapped at 1:1.
Result<uint256_t> issue_shares(
    uint256_t const &pool_tokens, uint256_t const &pool_shares,
    uint256_t const &tokens);

// Tokens backing `shares`, rounded down.
Result<uint256_t> redeem_shares(
    uint256_t const &pool_tokens, uint256_t const &pool_shares,
    uint256_t const &shares);

// Shares that must be burned to take `tokens` out of the pool, rounded up.
Result<uint256_t> shares_for_tokens(
    uint256_t const &pool_tokens, uint256_t const &pool_shares,
    uint256_t const &tokens);

Result<uint256_t> ppm_mul(uint256_t const &value, uint32_t ppm);

HORIZON_STAKING_NAMESPACE_END
