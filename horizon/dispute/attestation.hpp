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
#include <horizon/core/bytes.hpp>
#include <horizon/core/result.hpp>
#include <horizon/dispute/config.hpp>

#include <cstddef>
#include <cstdint>

HORIZON_DISPUTE_NAMESPACE_BEGIN

// An indexer's signed statement that `response_cid` answers `request_cid`
// on `subgraph_deployment_id`.
struct Attestation
{
    bytes32_t request_cid{};
    bytes32_t response_cid{};
    bytes32_t subgraph_deployment_id{};
    bytes32_t r{};
    bytes32_t s{};
    uint8_t v{0};

    friend bool operator==(Attestation const &, Attestation const &) = default;
};

inline constexpr size_t ATTESTATION_SIZE = 5 * sizeof(bytes32_t) + 1;

static_assert(ATTESTATION_SIZE == 161);

Result<Attestation> decode_attestation(byte_string_view);

byte_string encode_attestation(Attestation const &);

// Same request on the same deployment answered differently
bool are_conflicting(Attestation const &, Attestation const &);

HORIZON_DISPUTE_NAMESPACE_END
