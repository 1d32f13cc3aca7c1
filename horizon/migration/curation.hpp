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

#include <horizon/core/bytes.hpp>
#include <horizon/core/int.hpp>
#include <horizon/core/result.hpp>
#include <horizon/migration/config.hpp>

HORIZON_MIGRATION_NAMESPACE_BEGIN

// Bonding curve pools keyed by subgraph deployment
class Curation
{
public:
    virtual ~Curation() = default;

    virtual uint256_t
    get_deployment_signal(bytes32_t const &deployment_id) const = 0;

    virtual Result<uint256_t> tokens_to_signal_no_tax(
        bytes32_t const &deployment_id, uint256_t const &tokens) const = 0;

    // Deposits tokens without the curation tax and returns the signal
    // minted to the caller
    virtual Result<uint256_t> mint_signal_no_tax(
        bytes32_t const &deployment_id, uint256_t const &tokens) = 0;
};

HORIZON_MIGRATION_NAMESPACE_END
