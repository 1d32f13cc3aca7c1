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

#include <horizon/core/config.hpp>

#include <cstddef>

#define HORIZON_MPT_NAMESPACE_BEGIN                                            \
    HORIZON_NAMESPACE_BEGIN namespace mpt                                      \
    {

#define HORIZON_MPT_NAMESPACE_END                                              \
    }                                                                          \
    HORIZON_NAMESPACE_END

#define HORIZON_MPT_NAMESPACE ::horizon::mpt

HORIZON_MPT_NAMESPACE_BEGIN

static constexpr unsigned char RLP_EMPTY_STRING = 0x80;

// A branch node has one slot per nibble plus a value slot
static constexpr size_t BRANCH_ITEMS = 17;

// Extension and leaf nodes are [compact path, child or value]
static constexpr size_t SHORT_NODE_ITEMS = 2;

HORIZON_MPT_NAMESPACE_END
