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

#include <horizon/staking/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

HORIZON_STAKING_NAMESPACE_BEGIN

enum class StakingError
{
    Success = 0,
    NotAuthorized,
    InvalidZeroTokens,
    InvalidZeroShares,
    ProvisionTooSmall,
    InvalidMaxVerifierCut,
    InvalidThawingPeriod,
    ProvisionAlreadyExists,
    ProvisionNotFound,
    InsufficientIdleStake,
    InsufficientTokens,
    InsufficientShares,
    ZeroShares,
    InvalidPoolState,
    TooManyThawRequests,
    InsufficientThawedTokens,
    VerifierCutTooHigh,
    NoTokensToSlash,
    MinimumDelegation,
    NoLockedTokens,
    StillThawing,
};

HORIZON_STAKING_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<horizon::staking::StakingError>
    : quick_status_code_from_enum_defaults<horizon::staking::StakingError>
{
    static constexpr auto const domain_name = "Staking Error";
    static constexpr auto const domain_uuid =
        "9c1e7d42-58b3-4f0a-a6d2-3e8b0f71c5a4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
