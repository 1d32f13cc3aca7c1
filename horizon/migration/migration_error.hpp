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

#include <horizon/migration/config.hpp>

#include <boost/outcome/experimental/status-code/config.hpp>
#include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>

#include <initializer_list>

HORIZON_MIGRATION_NAMESPACE_BEGIN

enum class MigrationError
{
    Success = 0,
    OnlyGateway,
    OnlyCounterpartThroughBridge,
    AlreadyFinalized,
    NotAuthorized,
    NotMigrated,
    DeploymentZero,
    PreCurated,
    AlreadyClaimed,
    OnlyCounterpartAlias,
    InvalidInput,
};

HORIZON_MIGRATION_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<horizon::migration::MigrationError>
    : quick_status_code_from_enum_defaults<horizon::migration::MigrationError>
{
    static constexpr auto const domain_name = "Migration Error";
    static constexpr auto const domain_uuid =
        "7f1c9a3e-5b2d-4e86-a0c4-d93b6e218f05";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
