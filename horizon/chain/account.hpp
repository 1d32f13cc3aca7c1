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
#include <horizon/core/config.hpp>
#include <horizon/core/int.hpp>

#include <cstdint>

HORIZON_NAMESPACE_BEGIN

// State trie leaf of an L1 account
struct Account
{
    uint64_t nonce{0};
    uint256_t balance{0};
    bytes32_t storage_root{NULL_ROOT};
    bytes32_t code_hash{NULL_HASH};

    friend bool operator==(Account const &, Account const &) = default;
};

HORIZON_NAMESPACE_END
