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

#include <horizon/core/address.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/contract/events.hpp>
#include <horizon/core/int.hpp>
#include <horizon/dispute/config.hpp>

#include <cstdint>
#include <map>
#include <vector>

HORIZON_DISPUTE_NAMESPACE_BEGIN

inline constexpr Address DISPUTE_MANAGER_CA{0x1001};

enum class DisputeType : uint8_t
{
    Null = 0,
    Indexing,
    Query,
};

enum class DisputeStatus : uint8_t
{
    Null = 0,
    Pending,
    Accepted,
    Rejected,
    Drawn,
    Cancelled,
};

struct Dispute
{
    Address indexer{};
    Address fisherman{};
    uint256_t deposit{0};
    bytes32_t related_dispute_id{};
    DisputeType type{DisputeType::Null};
    DisputeStatus status{DisputeStatus::Null};
    uint64_t created_at{0};
};

struct DisputeParams
{
    Address arbitrator{};
    uint256_t minimum_deposit{0};
    // share of the slashed tokens paid to the fisherman, in ppm
    uint32_t fisherman_reward_cut{0};
    // cap on a slash as a share of the indexer's provision, in ppm
    uint32_t max_slashing_cut{0};
    uint64_t dispute_period{0};
};

struct DisputeStore
{
    std::map<bytes32_t, Dispute> disputes{};

    // deposits held, paid back and burned
    uint256_t deposits{0};
    std::map<Address, uint256_t> returned{};
    uint256_t burned{0};

    std::vector<LogEntry> events{};

    void emit_log(LogEntry const &event)
    {
        events.push_back(event);
    }
};

HORIZON_DISPUTE_NAMESPACE_END
