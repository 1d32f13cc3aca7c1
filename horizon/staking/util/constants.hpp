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
#include <horizon/core/int.hpp>
#include <horizon/staking/config.hpp>

#include <cstdint>

#include <intx/intx.hpp>

HORIZON_STAKING_NAMESPACE_BEGIN

using namespace intx::literals;

inline constexpr uint256_t GRT{1000000000000000000_u256};

inline constexpr uint256_t MIN_PROVISION_SIZE = GRT;
inline constexpr uint256_t MINIMUM_DELEGATION = GRT;

inline constexpr uint32_t MAX_PPM{1'000'000};
inline constexpr uint32_t MAX_MAX_VERIFIER_CUT{500'000};
inline constexpr uint32_t MAX_THAW_REQUESTS{100};

inline constexpr uint64_t DEFAULT_MAX_THAWING_PERIOD{28 * 24 * 60 * 60};
inline constexpr uint32_t DEFAULT_DELEGATION_RATIO{16};

inline constexpr Address STAKING_CA{0x1000};

static_assert(MAX_MAX_VERIFIER_CUT <= MAX_PPM);

enum class ThawRequestType : uint8_t
{
    Provision = 0,
    Delegation = 1,
};

HORIZON_STAKING_NAMESPACE_END
