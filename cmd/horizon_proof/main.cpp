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
#include <horizon/chain/block_header.hpp>
#include <horizon/chain/rlp/block_header_rlp.hpp>
#include <horizon/chain/rpc_json.hpp>
#include <horizon/chain/state_root.hpp>
#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/fmt/address_fmt.hpp> // NOLINT
#include <horizon/core/fmt/bytes_fmt.hpp> // NOLINT
#include <horizon/core/fmt/int_fmt.hpp> // NOLINT
#include <horizon/core/likely.h>
#include <horizon/core/log_level_map.hpp>
#include <horizon/migration/l1_gns.hpp>
#include <horizon/mpt/proof.hpp>

#include <CLI/CLI.hpp>

#include <evmc/hex.hpp>
#include <nlohmann/json.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/detail/LogMacros.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace
{
    // Accepts a bare result object or a full json-rpc response
    nlohmann::json load_rpc_result(std::filesystem::path const &path)
    {
        std::ifstream in{path};
        auto json = nlohmann::json::parse(in);
        if (json.contains("result")) {
            return json.at("result");
        }
        return json;
    }
}

int main(int const argc, char const *argv[])
{
    using namespace horizon;

    CLI::App cli{"horizon_proof"};
    cli.option_defaults()->always_capture_default();

    std::filesystem::path block_path{};
    std::filesystem::path proof_path{};
    std::string block_hash_hex{};
    std::string subgraph_id_hex{};
    std::string curator_hex{};
    auto log_level = quill::LogLevel::Info;

    cli.add_option(
           "--block", block_path, "eth_getBlockByHash response (json file)")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option("--proof", proof_path, "eth_getProof response (json file)")
        ->required()
        ->check(CLI::ExistingFile);
    cli.add_option(
        "--block_hash",
        block_hash_hex,
        "expected block hash, defaults to the hash in the block response");
    auto *const subgraph_opt = cli.add_option(
        "--subgraph_id",
        subgraph_id_hex,
        "subgraph id, to check the proven slot against a curator balance");
    cli.add_option("--curator", curator_hex, "L1 curator address")
        ->needs(subgraph_opt);
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(time) [%(thread_id)] %(file_name):%(line_number) LOG_%(log_level)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    BlockHeader header;
    chain::AccountProof proof;
    bytes32_t expected_hash;
    try {
        auto const block = load_rpc_result(block_path);
        header = chain::block_header_from_json(block);
        proof = chain::account_proof_from_json(load_rpc_result(proof_path));
        auto const hash_hex = block_hash_hex.empty()
                                  ? block.at("hash").get<std::string>()
                                  : block_hash_hex;
        auto const hash = evmc::from_hex<bytes32_t>(hash_hex);
        if (!hash.has_value()) {
            LOG_ERROR("invalid block hash '{}'", hash_hex);
            return EXIT_FAILURE;
        }
        expected_hash = hash.value();
    }
    catch (std::exception const &e) {
        LOG_ERROR("could not read rpc responses: {}", e.what());
        return EXIT_FAILURE;
    }

    auto const state_root = chain::decode_verified_state_root(
        rlp::encode_block_header(header), expected_hash);
    if (HORIZON_UNLIKELY(state_root.has_error())) {
        LOG_ERROR(
            "block {} does not hash to {}: {}",
            header.number,
            expected_hash,
            state_root.assume_error().message().c_str());
        return EXIT_FAILURE;
    }
    LOG_INFO(
        "block {} state root {}", header.number, state_root.assume_value());

    auto const account = mpt::get_account(
        state_root.assume_value(), proof.address, proof.account_proof);
    if (HORIZON_UNLIKELY(account.has_error())) {
        LOG_ERROR(
            "account proof for {} failed with: {}",
            proof.address,
            account.assume_error().message().c_str());
        return EXIT_FAILURE;
    }
    auto const &storage_root = account.assume_value().storage_root;
    LOG_INFO(
        "account {} nonce={} balance={} storage_root={}",
        proof.address,
        account.assume_value().nonce,
        account.assume_value().balance,
        storage_root);

    std::optional<bytes32_t> curator_slot;
    if (!curator_hex.empty()) {
        auto const subgraph_id = evmc::from_hex<bytes32_t>(subgraph_id_hex);
        auto const curator = evmc::from_hex<Address>(curator_hex);
        if (!subgraph_id.has_value() || !curator.has_value()) {
            LOG_ERROR("invalid subgraph id or curator");
            return EXIT_FAILURE;
        }
        curator_slot = migration::l1_gns_curator_slot(
            subgraph_id.value(), curator.value());
        LOG_INFO(
            "curator {} of subgraph {} is at slot {}",
            curator.value(),
            subgraph_id.value(),
            curator_slot.value());
    }

    bool ok = true;
    bool curator_proven = false;
    for (auto const &storage : proof.storage_proof) {
        auto const value =
            mpt::get_storage_value(storage_root, storage.key, storage.proof);
        if (HORIZON_UNLIKELY(value.has_error())) {
            LOG_ERROR(
                "storage proof for slot {} failed with: {}",
                storage.key,
                value.assume_error().message().c_str());
            ok = false;
            continue;
        }
        if (HORIZON_UNLIKELY(value.assume_value() != storage.value)) {
            LOG_ERROR(
                "slot {} proves {} but the response claims {}",
                storage.key,
                value.assume_value(),
                storage.value);
            ok = false;
            continue;
        }
        LOG_INFO("slot {} = {}", storage.key, value.assume_value());
        curator_proven |= curator_slot == storage.key;
    }

    if (curator_slot.has_value() && !curator_proven) {
        LOG_ERROR("no valid proof for slot {}", curator_slot.value());
        ok = false;
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
