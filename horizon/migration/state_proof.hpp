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

#include <horizon/core/byte_string.hpp>
#include <horizon/core/result.hpp>
#include <horizon/migration/config.hpp>

#include <vector>

HORIZON_MIGRATION_NAMESPACE_BEGIN

// Account and storage proof of a single slot, as submitted with a curator
// balance claim
struct StateProof
{
    std::vector<byte_string> account_proof{};
    std::vector<byte_string> storage_proof{};
};

// Decodes the rlp list [[account nodes...], [storage nodes...]]. A node is
// either embedded as its own rlp list or wrapped in an rlp string.
Result<StateProof> decode_state_proof(byte_string_view);

HORIZON_MIGRATION_NAMESPACE_END
