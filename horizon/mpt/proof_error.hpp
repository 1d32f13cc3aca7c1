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

#include <horizon/mpt/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

HORIZON_MPT_NAMESPACE_BEGIN

enum class ProofError
{
    Success = 0,
    InvalidRootHash,
    InvalidNodeHash,
    KeyNotFound,
    InvalidNode,
};

HORIZON_MPT_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<horizon::mpt::ProofError>
    : quick_status_code_from_enum_defaults<horizon::mpt::ProofError>
{
    static constexpr auto const domain_name = "Proof Error";
    static constexpr auto const domain_uuid =
        "e2a4c8b6-1d3f-4a57-9c0e-8f6b2d4a1c93";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
