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

#include <horizon/chain/block_header.hpp>
#include <horizon/chain/rpc_json.hpp>
#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/int.hpp>
#include <horizon/rlp/encode2.hpp>

#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <test_resource_data.h>

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace horizon::test
{
    // A curator balance on the L1 GNS at mainnet block 15884906, proven with
    // eth_getProof against that block's state root
    struct MainnetCuratorProof
    {
        bytes32_t subgraph_id;
        Address curator;
        bytes32_t block_hash;
        uint64_t block_number;
        uint256_t n_signal;
        uint256_t curated_tokens;
        bytes32_t metadata;
        BlockHeader header;
        chain::AccountProof proof;
        chain::AccountProof proof_for_different_block;
    };

    inline MainnetCuratorProof const &mainnet_curator_proof()
    {
        static MainnetCuratorProof const fixture = [] {
            std::ifstream in{test_resource::mainnet_curator_proof_json};
            auto const json = nlohmann::json::parse(in);
            return MainnetCuratorProof{
                .subgraph_id = evmc::from_hex<bytes32_t>(
                                   json.at("subgraph_id").get<std::string>())
                                   .value(),
                .curator = evmc::from_hex<Address>(
                               json.at("curator").get<std::string>())
                               .value(),
                .block_hash = evmc::from_hex<bytes32_t>(
                                  json.at("block_hash").get<std::string>())
                                  .value(),
                .block_number = json.at("block_number").get<uint64_t>(),
                .n_signal = intx::from_string<uint256_t>(
                    json.at("n_signal").get<std::string>()),
                .curated_tokens = intx::from_string<uint256_t>(
                    json.at("curated_tokens").get<std::string>()),
                .metadata = evmc::from_hex<bytes32_t>(
                                json.at("metadata").get<std::string>())
                                .value(),
                .header = chain::block_header_from_json(json.at("block")),
                .proof = chain::account_proof_from_json(json.at("proof")),
                .proof_for_different_block = chain::account_proof_from_json(
                    json.at("proof_for_different_block")),
            };
        }();
        return fixture;
    }

    // [[account proof nodes...], [storage proof nodes...]]
    inline byte_string encode_state_proof(
        std::vector<byte_string> const &account_proof,
        std::vector<byte_string> const &storage_proof)
    {
        std::vector<byte_string> account_items;
        for (auto const &node : account_proof) {
            account_items.push_back(rlp::encode_string2(node));
        }
        std::vector<byte_string> storage_items;
        for (auto const &node : storage_proof) {
            storage_items.push_back(rlp::encode_string2(node));
        }
        return rlp::encode_list2(
            rlp::encode_list2(account_items), rlp::encode_list2(storage_items));
    }
}
