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

#include <horizon/migration/migration_error.hpp>

#include <boost/outcome/experimental/status-code/generic_code.hpp>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<horizon::migration::MigrationError>::mapping> const &
quick_status_code_from_enum<horizon::migration::MigrationError>::value_mappings()
{
    using horizon::migration::MigrationError;

    static std::initializer_list<mapping> const v = {
        {MigrationError::Success, "success", {errc::success}},
        {MigrationError::OnlyGateway, "caller is not the gateway", {}},
        {MigrationError::OnlyCounterpartThroughBridge,
         "sender is not the counterpart GNS",
         {}},
        {MigrationError::AlreadyFinalized, "subgraph already finalized", {}},
        {MigrationError::NotAuthorized, "caller not authorized", {}},
        {MigrationError::NotMigrated, "subgraph not migrated", {}},
        {MigrationError::DeploymentZero, "zero deployment id", {}},
        {MigrationError::PreCurated, "deployment already curated", {}},
        {MigrationError::AlreadyClaimed, "balance already claimed", {}},
        {MigrationError::OnlyCounterpartAlias,
         "caller is not the counterpart GNS alias",
         {}},
        {MigrationError::InvalidInput, "invalid input", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
