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
#include <horizon/core/bytes.hpp>
#include <horizon/core/likely.h>
#include <horizon/dispute/attestation.hpp>
#include <horizon/dispute/dispute_error.hpp>

#include <algorithm>

HORIZON_DISPUTE_NAMESPACE_BEGIN

namespace
{
    bytes32_t consume_bytes32(byte_string_view &data)
    {
        bytes32_t word;
        std::copy_n(data.begin(), sizeof(bytes32_t), word.bytes);
        data.remove_prefix(sizeof(bytes32_t));
        return word;
    }
}

Result<Attestation> decode_attestation(byte_string_view data)
{
    if (HORIZON_UNLIKELY(data.size() != ATTESTATION_SIZE)) {
        return DisputeError::InvalidAttestationLength;
    }

    Attestation att;
    att.request_cid = consume_bytes32(data);
    att.response_cid = consume_bytes32(data);
    att.subgraph_deployment_id = consume_bytes32(data);
    att.r = consume_bytes32(data);
    att.s = consume_bytes32(data);
    att.v = data.front();
    return att;
}

byte_string encode_attestation(Attestation const &att)
{
    byte_string out;
    out += to_byte_string_view(att.request_cid.bytes);
    out += to_byte_string_view(att.response_cid.bytes);
    out += to_byte_string_view(att.subgraph_deployment_id.bytes);
    out += to_byte_string_view(att.r.bytes);
    out += to_byte_string_view(att.s.bytes);
    out.push_back(att.v);
    return out;
}

bool are_conflicting(Attestation const &a, Attestation const &b)
{
    return a.request_cid == b.request_cid &&
           a.subgraph_deployment_id == b.subgraph_deployment_id &&
           a.response_cid != b.response_cid;
}

HORIZON_DISPUTE_NAMESPACE_END
