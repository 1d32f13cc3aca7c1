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

#include <horizon/core/byte_string.hpp>
#include <horizon/core/likely.h>
#include <horizon/migration/migration_error.hpp>
#include <horizon/migration/state_proof.hpp>
#include <horizon/rlp/decode.hpp>
#include <horizon/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <vector>

HORIZON_MIGRATION_NAMESPACE_BEGIN

namespace
{
    Result<std::vector<byte_string>> decode_nodes(byte_string_view const enc)
    {
        BOOST_OUTCOME_TRY(auto const items, rlp::decode_list_items(enc));
        std::vector<byte_string> nodes;
        nodes.reserve(items.size());
        for (auto item : items) {
            if (item.front() >= 0xc0) {
                nodes.emplace_back(item);
                continue;
            }
            BOOST_OUTCOME_TRY(auto const node, rlp::decode_string(item));
            if (HORIZON_UNLIKELY(!item.empty())) {
                return rlp::DecodeError::InputTooLong;
            }
            nodes.emplace_back(node);
        }
        return nodes;
    }
}

Result<StateProof> decode_state_proof(byte_string_view const enc)
{
    BOOST_OUTCOME_TRY(auto const items, rlp::decode_list_items(enc));
    if (HORIZON_UNLIKELY(items.size() != 2)) {
        return MigrationError::InvalidInput;
    }
    StateProof proof;
    BOOST_OUTCOME_TRY(proof.account_proof, decode_nodes(items[0]));
    BOOST_OUTCOME_TRY(proof.storage_proof, decode_nodes(items[1]));
    return proof;
}

HORIZON_MIGRATION_NAMESPACE_END
