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

#include <horizon/dispute/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

HORIZON_DISPUTE_NAMESPACE_BEGIN

enum class DisputeError
{
    Success = 0,
    InvalidAttestationLength,
    NonConflictingAttestations,
    NotArbitrator,
    NotFisherman,
    InsufficientDeposit,
    IndexerNotFound,
    DisputeAlreadyCreated,
    InvalidDispute,
    DisputeNotPending,
    MustAcceptRelated,
    InvalidTokensSlash,
    DisputePeriodNotFinished,
};

HORIZON_DISPUTE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<horizon::dispute::DisputeError>
    : quick_status_code_from_enum_defaults<horizon::dispute::DisputeError>
{
    static constexpr auto const domain_name = "Dispute Error";
    static constexpr auto const domain_uuid =
        "4b7d2e90-c13a-4f68-8e5b-a0f9d6c21e37";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
