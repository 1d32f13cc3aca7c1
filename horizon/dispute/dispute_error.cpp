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

#include <horizon/dispute/dispute_error.hpp>

#include <boost/outcome/experimental/status-code/generic_code.hpp>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<horizon::dispute::DisputeError>::mapping> const &
quick_status_code_from_enum<horizon::dispute::DisputeError>::value_mappings()
{
    using horizon::dispute::DisputeError;

    static std::initializer_list<mapping> const v = {
        {DisputeError::Success, "success", {errc::success}},
        {DisputeError::InvalidAttestationLength,
         "invalid attestation length",
         {}},
        {DisputeError::NonConflictingAttestations,
         "attestations do not conflict",
         {}},
        {DisputeError::NotArbitrator, "caller is not the arbitrator", {}},
        {DisputeError::NotFisherman, "caller is not the fisherman", {}},
        {DisputeError::InsufficientDeposit, "insufficient deposit", {}},
        {DisputeError::IndexerNotFound, "indexer has no provision", {}},
        {DisputeError::DisputeAlreadyCreated, "dispute already created", {}},
        {DisputeError::InvalidDispute, "unknown dispute", {}},
        {DisputeError::DisputeNotPending, "dispute not pending", {}},
        {DisputeError::MustAcceptRelated,
         "conflicting dispute must be accepted or drawn",
         {}},
        {DisputeError::InvalidTokensSlash, "slash amount too high", {}},
        {DisputeError::DisputePeriodNotFinished,
         "dispute period not finished",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
