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

#include <horizon/core/address.hpp>
#include <horizon/staking/authorizer.hpp>
#include <horizon/staking/config.hpp>

#include <tuple>
#include <utility>

HORIZON_STAKING_NAMESPACE_BEGIN

void OperatorAllowlist::set_operator(
    Address const &provider, Address const &verifier, Address const &op,
    bool const allowed)
{
    auto const key = std::make_tuple(provider, verifier, op);
    if (allowed) {
        operators_.insert(key);
    }
    else {
        operators_.erase(key);
    }
}

void OperatorAllowlist::set_global_operator(
    Address const &provider, Address const &op, bool const allowed)
{
    auto const key = std::make_pair(provider, op);
    if (allowed) {
        global_operators_.insert(key);
    }
    else {
        global_operators_.erase(key);
    }
}

bool OperatorAllowlist::is_authorized(
    Address const &provider, Address const &verifier,
    Address const &caller) const
{
    if (caller == provider) {
        return true;
    }
    if (global_operators_.contains(std::make_pair(provider, caller))) {
        return true;
    }
    return operators_.contains(std::make_tuple(provider, verifier, caller));
}

HORIZON_STAKING_NAMESPACE_END
