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

#include <horizon/core/checked_math.hpp>
#include <horizon/core/likely.h>
#include <horizon/staking/util/constants.hpp>
#include <horizon/staking/util/shares.hpp>
#include <horizon/staking/util/staking_error.hpp>

#include <boost/outcome/try.hpp>

HORIZON_STAKING_NAMESPACE_BEGIN

Result<uint256_t> issue_shares(
    uint256_t const &pool_tokens, uint256_t const &pool_shares,
    uint256_t const &tokens)
{
    if (pool_shares == 0) {
        return tokens;
    }
    if (HORIZON_UNLIKELY(pool_tokens == 0)) {
        return StakingError::InvalidPoolState;
    }
    BOOST_OUTCOME_TRY(
        auto const shares, checked_mul_div(tokens, pool_shares, pool_tokens));
    if (HORIZON_UNLIKELY(shares == 0)) {
        return StakingError::ZeroShares;
    }
    return shares;
}

Result<uint256_t> redeem_shares(
    uint256_t const &pool_tokens, uint256_t const &pool_shares,
    uint256_t const &shares)
{
    if (pool_shares == 0) {
        return uint256_t{0};
    }
    return checked_mul_div(shares, pool_tokens, pool_shares);
}

Result<uint256_t> shares_for_tokens(
    uint256_t const &pool_tokens, uint256_t const &pool_shares,
    uint256_t const &tokens)
{
    if (HORIZON_UNLIKELY(pool_tokens == 0)) {
        return StakingError::InvalidPoolState;
    }
    BOOST_OUTCOME_TRY(auto const product, checked_mul(tokens, pool_shares));
    BOOST_OUTCOME_TRY(
        auto const rounded, checked_add(product, pool_tokens - 1));
    return rounded / pool_tokens;
}

Result<uint256_t> ppm_mul(uint256_t const &value, uint32_t const ppm)
{
    return checked_mul_div(value, ppm, MAX_PPM);
}

HORIZON_STAKING_NAMESPACE_END
