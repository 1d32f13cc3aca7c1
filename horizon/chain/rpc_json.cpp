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

#include <horizon/chain/block_header.hpp>
#include <horizon/chain/config.hpp>
#include <horizon/chain/rpc_json.hpp>
#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/int.hpp>

#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

HORIZON_CHAIN_NAMESPACE_BEGIN

namespace
{
    template <typename T>
    T fixed_from_hex(nlohmann::json const &j)
    {
        auto const s = j.get<std::string>();
        auto const bytes = bytes_from_hex(s);
        if (bytes.size() != sizeof(T)) {
            throw std::invalid_argument{"unexpected hex length: " + s};
        }
        T out{};
        std::copy_n(bytes.begin(), sizeof(T), out.bytes);
        return out;
    }

    uint256_t quantity(nlohmann::json const &j)
    {
        return intx::from_string<uint256_t>(j.get<std::string>());
    }

    uint64_t quantity64(nlohmann::json const &j)
    {
        auto const n = quantity(j);
        if (n > std::numeric_limits<uint64_t>::max()) {
            throw std::out_of_range{"quantity exceeds 64 bits"};
        }
        return static_cast<uint64_t>(n);
    }

    std::vector<byte_string> proof_nodes(nlohmann::json const &j)
    {
        std::vector<byte_string> nodes;
        for (auto const &node : j) {
            nodes.emplace_back(bytes_from_hex(node.get<std::string>()));
        }
        return nodes;
    }
}

byte_string bytes_from_hex(std::string_view const hex)
{
    auto bytes = evmc::from_hex(hex);
    if (!bytes.has_value()) {
        throw std::invalid_argument{"invalid hex: " + std::string{hex}};
    }
    return std::move(bytes).value();
}

BlockHeader block_header_from_json(nlohmann::json const &j)
{
    BlockHeader header;
    header.parent_hash = fixed_from_hex<bytes32_t>(j.at("parentHash"));
    header.ommers_hash = fixed_from_hex<bytes32_t>(j.at("sha3Uncles"));
    header.beneficiary = fixed_from_hex<Address>(j.at("miner"));
    header.state_root = fixed_from_hex<bytes32_t>(j.at("stateRoot"));
    header.transactions_root =
        fixed_from_hex<bytes32_t>(j.at("transactionsRoot"));
    header.receipts_root = fixed_from_hex<bytes32_t>(j.at("receiptsRoot"));

    auto const bloom = bytes_from_hex(j.at("logsBloom").get<std::string>());
    if (bloom.size() != header.logs_bloom.size()) {
        throw std::invalid_argument{"unexpected logsBloom length"};
    }
    std::copy(bloom.begin(), bloom.end(), header.logs_bloom.begin());

    header.difficulty = quantity(j.at("difficulty"));
    header.number = quantity64(j.at("number"));
    header.gas_limit = quantity64(j.at("gasLimit"));
    header.gas_used = quantity64(j.at("gasUsed"));
    header.timestamp = quantity64(j.at("timestamp"));
    header.extra_data = bytes_from_hex(j.at("extraData").get<std::string>());
    header.prev_randao = fixed_from_hex<bytes32_t>(j.at("mixHash"));

    auto const nonce = bytes_from_hex(j.at("nonce").get<std::string>());
    if (nonce.size() != header.nonce.size()) {
        throw std::invalid_argument{"unexpected nonce length"};
    }
    std::copy(nonce.begin(), nonce.end(), header.nonce.begin());

    if (j.contains("baseFeePerGas")) {
        header.base_fee_per_gas = quantity(j["baseFeePerGas"]);
    }
    if (j.contains("withdrawalsRoot")) {
        header.withdrawals_root =
            fixed_from_hex<bytes32_t>(j["withdrawalsRoot"]);
    }
    if (j.contains("blobGasUsed")) {
        header.blob_gas_used = quantity64(j["blobGasUsed"]);
        header.excess_blob_gas = quantity64(j.at("excessBlobGas"));
    }
    if (j.contains("parentBeaconBlockRoot")) {
        header.parent_beacon_block_root =
            fixed_from_hex<bytes32_t>(j["parentBeaconBlockRoot"]);
    }
    if (j.contains("requestsHash")) {
        header.requests_hash = fixed_from_hex<bytes32_t>(j["requestsHash"]);
    }
    return header;
}

AccountProof account_proof_from_json(nlohmann::json const &j)
{
    AccountProof proof;
    proof.address = fixed_from_hex<Address>(j.at("address"));
    proof.nonce = quantity64(j.at("nonce"));
    proof.balance = quantity(j.at("balance"));
    proof.storage_hash = fixed_from_hex<bytes32_t>(j.at("storageHash"));
    proof.code_hash = fixed_from_hex<bytes32_t>(j.at("codeHash"));
    proof.account_proof = proof_nodes(j.at("accountProof"));
    for (auto const &entry : j.at("storageProof")) {
        proof.storage_proof.push_back(StorageProof{
            .key = to_bytes(quantity(entry.at("key"))),
            .value = quantity(entry.at("value")),
            .proof = proof_nodes(entry.at("proof"))});
    }
    return proof;
}

HORIZON_CHAIN_NAMESPACE_END
