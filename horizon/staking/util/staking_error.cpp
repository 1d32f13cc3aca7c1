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

#include <horizon/staking/util/staking_error.hpp>

#include <boost/outcome/experimental/status-code/generic_code.hpp>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<horizon::staking::StakingError>::mapping> const &
quick_status_code_from_enum<horizon::staking::StakingError>::value_mappings()
{
    using horizon::staking::StakingError;

    static std::initializer_list<mapping> const v = {
        {StakingError::Success, "success", {errc::success}},
        {StakingError::NotAuthorized, "caller not authorized", {}},
        {StakingError::InvalidZeroTokens, "zero tokens", {}},
        {StakingError::InvalidZeroShares, "zero shares", {}},
        {StakingError::ProvisionTooSmall, "provision below minimum", {}},
        {StakingError::InvalidMaxVerifierCut, "invalid max verifier cut", {}},
        {StakingError::InvalidThawingPeriod, "invalid thawing period", {}},
        {StakingError::ProvisionAlreadyExists, "provision already exists", {}},
        {StakingError::ProvisionNotFound, "provision not found", {}},
        {StakingError::InsufficientIdleStake, "insufficient idle stake", {}},
        {StakingError::InsufficientTokens, "insufficient tokens", {}},
        {StakingError::InsufficientShares, "insufficient shares", {}},
        {StakingError::ZeroShares, "issued zero shares", {}},
        {StakingError::InvalidPoolState, "invalid pool state", {}},
        {StakingError::TooManyThawRequests, "too many thaw requests", {}},
        {StakingError::InsufficientThawedTokens,
         "insufficient thawed tokens",
         {}},
        {StakingError::VerifierCutTooHigh, "verifier cut too high", {}},
        {StakingError::NoTokensToSlash, "no tokens to slash", {}},
        {StakingError::MinimumDelegation, "delegation below minimum", {}},
        {StakingError::NoLockedTokens, "no locked tokens", {}},
        {StakingError::StillThawing, "locked tokens still thawing", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
