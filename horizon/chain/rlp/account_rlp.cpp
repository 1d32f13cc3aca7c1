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

#include <horizon/chain/account.hpp>
#include <horizon/chain/rlp/account_rlp.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/int.hpp>
#include <horizon/core/likely.h>
#include <horizon/core/result.hpp>
#include <horizon/rlp/bytes_rlp.hpp>
#include <horizon/rlp/config.hpp>
#include <horizon/rlp/decode.hpp>
#include <horizon/rlp/decode_error.hpp>
#include <horizon/rlp/encode2.hpp>
#include <horizon/rlp/int_rlp.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

HORIZON_RLP_NAMESPACE_BEGIN

byte_string encode_account(Account const &account)
{
    return encode_list2(
        encode_unsigned(account.nonce),
        encode_unsigned(account.balance),
        encode_bytes32(account.storage_root),
        encode_bytes32(account.code_hash));
}

Result<Account> decode_account(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    Account acct;
    BOOST_OUTCOME_TRY(acct.nonce, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(acct.balance, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(acct.storage_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(acct.code_hash, decode_bytes32(payload));

    if (HORIZON_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return acct;
}

HORIZON_RLP_NAMESPACE_END
