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
#include <horizon/staking/config.hpp>

#include <set>
#include <tuple>
#include <utility>

HORIZON_STAKING_NAMESPACE_BEGIN

// Decides whether `caller` may act for `provider` on its provision with
// `verifier`.
class Authorizer
{
public:
    virtual ~Authorizer() = default;

    virtual bool is_authorized(
        Address const &provider, Address const &verifier,
        Address const &caller) const = 0;
};

// A provider is always authorized for itself. Operators are allowed either
// for one verifier or for every verifier of the provider.
class OperatorAllowlist final : public Authorizer
{
    std::set<std::tuple<Address, Address, Address>> operators_;
    std::set<std::pair<Address, Address>> global_operators_;

public:
    void set_operator(
        Address const &provider, Address const &verifier,
        Address const &op, bool allowed);

    void set_global_operator(
        Address const &provider, Address const &op, bool allowed);

    bool is_authorized(
        Address const &provider, Address const &verifier,
        Address const &caller) const override;
};

HORIZON_STAKING_NAMESPACE_END
