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
#include <horizon/chain/header_error.hpp>
#include <horizon/chain/rlp/block_header_rlp.hpp>
#include <horizon/core/address.hpp>
#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/contract/abi_decode_error.hpp>
#include <horizon/core/contract/abi_signatures.hpp>
#include <horizon/core/int.hpp>
#include <horizon/core/result.hpp>
#include <horizon/migration/constants.hpp>
#include <horizon/migration/coordinator.hpp>
#include <horizon/migration/curation.hpp>
#include <horizon/migration/l1_gns.hpp>
#include <horizon/migration/migration_error.hpp>
#include <horizon/migration/state_proof.hpp>
#include <horizon/migration/types.hpp>
#include <horizon/mpt/proof_error.hpp>
#include <horizon/rlp/encode2.hpp>
#include <horizon/test_util/mainnet_fixture.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <algorithm>
#include <map>
#include <vector>

using namespace horizon;
using namespace horizon::migration;
using namespace horizon::test;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    // Mints one signal per two tokens
    class FakeCuration final : public Curation
    {
    public:
        std::map<bytes32_t, uint256_t> signal;

        uint256_t
        get_deployment_signal(bytes32_t const &deployment_id) const override
        {
            auto const it = signal.find(deployment_id);
            return it == signal.end() ? uint256_t{0} : it->second;
        }

        Result<uint256_t> tokens_to_signal_no_tax(
            bytes32_t const &, uint256_t const &tokens) const override
        {
            return tokens / 2;
        }

        Result<uint256_t> mint_signal_no_tax(
            bytes32_t const &deployment_id, uint256_t const &tokens) override
        {
            BOOST_OUTCOME_TRY(
                auto const minted,
                tokens_to_signal_no_tax(deployment_id, tokens));
            signal[deployment_id] += minted;
            return minted;
        }
    };

    byte_string mainnet_proof_rlp(chain::AccountProof const &proof)
    {
        return encode_state_proof(
            proof.account_proof, proof.storage_proof.front().proof);
    }
}

TEST(L1Gns, curator_slot)
{
    auto const &fixture = mainnet_curator_proof();
    EXPECT_EQ(
        l1_gns_curator_slot(fixture.subgraph_id, fixture.curator),
        0x2757396e3ce68a9104b5d84b5b0988e37067e780df1ad018184da3616033f432_bytes32);
    EXPECT_EQ(
        l1_gns_curator_slot(fixture.subgraph_id, fixture.curator),
        fixture.proof.storage_proof.front().key);
}

TEST(L1Gns, address_alias)
{
    EXPECT_EQ(
        apply_l1_to_l2_alias(Address{1}),
        0x1111000000000000000000000000000000001112_address);
    EXPECT_EQ(
        apply_l1_to_l2_alias(
            0xffffffffffffffffffffffffffffffffffffffff_address),
        0x1111000000000000000000000000000000001110_address);
}

TEST(L1Gns, callhook_data)
{
    SubgraphMigrationData const data{
        .subgraph_id = 0x01_bytes32,
        .owner = Address{0xabc},
        .lock_block_hash = 0x02_bytes32,
        .n_signal = 4567,
        .reserve_ratio = DEFAULT_RESERVE_RATIO,
        .metadata = 0x03_bytes32};
    byte_string const encoded = encode_callhook_data(data);
    ASSERT_EQ(encoded.size(), CALLHOOK_DATA_SIZE);

    auto const decoded = decode_callhook_data(encoded);
    ASSERT_FALSE(decoded.has_error());
    EXPECT_EQ(decoded.value().subgraph_id, data.subgraph_id);
    EXPECT_EQ(decoded.value().owner, data.owner);
    EXPECT_EQ(decoded.value().lock_block_hash, data.lock_block_hash);
    EXPECT_EQ(decoded.value().n_signal, data.n_signal);
    EXPECT_EQ(decoded.value().reserve_ratio, data.reserve_ratio);
    EXPECT_EQ(decoded.value().metadata, data.metadata);

    auto const short_input =
        decode_callhook_data(byte_string_view{encoded}.substr(0, 5 * 32));
    ASSERT_TRUE(short_input.has_error());
    EXPECT_EQ(short_input.assume_error(), AbiDecodeError::InputTooShort);

    byte_string long_input = encoded;
    long_input.push_back(0);
    auto const trailing = decode_callhook_data(long_input);
    ASSERT_TRUE(trailing.has_error());
    EXPECT_EQ(trailing.assume_error(), AbiDecodeError::InputTooLong);
}

TEST(StateProof, node_encodings)
{
    byte_string const node1 = rlp::encode_list2(
        rlp::encode_string2(byte_string(2, 0x20)),
        rlp::encode_string2(byte_string(40, 0xaa)));
    byte_string const node2 = rlp::encode_list2(
        rlp::encode_string2(byte_string(1, 0x3f)),
        rlp::encode_string2(byte_string(1, 0x01)));

    // wrapped in strings
    auto const wrapped =
        decode_state_proof(encode_state_proof({node1}, {node2}));
    ASSERT_FALSE(wrapped.has_error());
    ASSERT_EQ(wrapped.value().account_proof.size(), 1);
    EXPECT_EQ(wrapped.value().account_proof.front(), node1);
    ASSERT_EQ(wrapped.value().storage_proof.size(), 1);
    EXPECT_EQ(wrapped.value().storage_proof.front(), node2);

    // embedded as lists
    auto const embedded = decode_state_proof(
        rlp::encode_list2(rlp::encode_list2(node1), rlp::encode_list2(node2)));
    ASSERT_FALSE(embedded.has_error());
    EXPECT_EQ(embedded.value().account_proof.front(), node1);
    EXPECT_EQ(embedded.value().storage_proof.front(), node2);

    auto const three = decode_state_proof(rlp::encode_list2(
        rlp::encode_list2(node1),
        rlp::encode_list2(node2),
        rlp::encode_list2(node2)));
    ASSERT_TRUE(three.has_error());
    EXPECT_EQ(three.assume_error(), MigrationError::InvalidInput);
}

struct Migration : public ::testing::Test
{
    Address const gateway{0x6a7e};
    Address const governor{0x60f};
    Address const l1_gns{0x11};
    Address const me{0x3e};
    Address const other{0x07};

    MigrationStore store;
    FakeCuration curation;
    MigrationCoordinator coordinator{
        store,
        curation,
        MigrationParams{
            .gateway = gateway, .governor = governor, .chain_id = 42161}};

    bytes32_t const subgraph_id{0x5b_bytes32};
    bytes32_t const deployment_id{0xde_bytes32};
    bytes32_t const lock_block_hash{0xb10c_bytes32};
    bytes32_t const metadata{0x3e7a_bytes32};
    uint256_t const curated_tokens{1337 * 1000000000000000000_u256};
    uint256_t const n_signal{4567};

    void SetUp() override
    {
        ASSERT_FALSE(
            coordinator.set_counterpart_address(governor, l1_gns).has_error());
    }

    byte_string callhook(
        bytes32_t const &id, bytes32_t const &block_hash,
        uint256_t const &signal) const
    {
        return encode_callhook_data(SubgraphMigrationData{
            .subgraph_id = id,
            .owner = me,
            .lock_block_hash = block_hash,
            .n_signal = signal,
            .reserve_ratio = DEFAULT_RESERVE_RATIO,
            .metadata = metadata});
    }

    Result<void> receive(
        bytes32_t const &id, uint256_t const &tokens,
        bytes32_t const &block_hash)
    {
        return coordinator.on_token_transfer(
            gateway, l1_gns, tokens, callhook(id, block_hash, n_signal));
    }

    void migrate(
        bytes32_t const &id, uint256_t const &tokens,
        bytes32_t const &block_hash)
    {
        ASSERT_FALSE(receive(id, tokens, block_hash).has_error());
        ASSERT_FALSE(
            coordinator.finish_migration(me, id, deployment_id, metadata)
                .has_error());
    }

    bool emitted(bytes32_t const &signature) const
    {
        return std::any_of(
            store.events.begin(), store.events.end(), [&](auto const &e) {
                return e.topics.front() == signature;
            });
    }
};

TEST_F(Migration, only_gateway)
{
    auto const res = coordinator.on_token_transfer(
        me, l1_gns, curated_tokens, callhook(subgraph_id, lock_block_hash, 1));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MigrationError::OnlyGateway);
    EXPECT_TRUE(store.migrations.empty());
}

TEST_F(Migration, only_counterpart_through_bridge)
{
    auto const res = coordinator.on_token_transfer(
        gateway, me, curated_tokens, callhook(subgraph_id, lock_block_hash, 1));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MigrationError::OnlyCounterpartThroughBridge);
    EXPECT_TRUE(store.migrations.empty());
}

TEST_F(Migration, receives_disabled_subgraph)
{
    ASSERT_FALSE(receive(subgraph_id, curated_tokens, lock_block_hash)
                     .has_error());

    auto const record = coordinator.get_migration_record(subgraph_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->tokens, curated_tokens);
    EXPECT_EQ(record->locked_at_block_hash, lock_block_hash);
    EXPECT_TRUE(record->l1_done);
    EXPECT_FALSE(record->l2_done);
    EXPECT_FALSE(record->deprecated);

    auto const subgraph = coordinator.get_subgraph(subgraph_id);
    ASSERT_TRUE(subgraph.has_value());
    EXPECT_EQ(subgraph->v_signal, 0);
    EXPECT_EQ(subgraph->n_signal, n_signal);
    EXPECT_EQ(subgraph->deployment_id, bytes32_t{});
    EXPECT_EQ(subgraph->reserve_ratio, DEFAULT_RESERVE_RATIO);
    EXPECT_TRUE(subgraph->disabled);
    EXPECT_EQ(subgraph->owner, me);

    EXPECT_TRUE(emitted(abi_encode_event_signature(
        "SubgraphReceivedFromL1(uint256,address,uint256)")));
    EXPECT_TRUE(emitted(
        abi_encode_event_signature("SubgraphMetadataUpdated(uint256,bytes32)")));
    EXPECT_EQ(store.tokens_received, curated_tokens);
}

TEST_F(Migration, does_not_conflict_with_native_subgraph)
{
    auto const native =
        coordinator.publish_subgraph(me, deployment_id, metadata);
    ASSERT_FALSE(native.has_error());
    EXPECT_EQ(native.value(), build_subgraph_id(me, 0, 42161));

    ASSERT_FALSE(receive(subgraph_id, curated_tokens, lock_block_hash)
                     .has_error());
    EXPECT_NE(native.value(), subgraph_id);

    auto const l2 = coordinator.get_subgraph(native.value());
    ASSERT_TRUE(l2.has_value());
    EXPECT_EQ(l2->n_signal, 0);
    EXPECT_EQ(l2->v_signal, 0);
    EXPECT_EQ(l2->deployment_id, deployment_id);
    EXPECT_FALSE(l2->disabled);
    EXPECT_FALSE(coordinator.get_migration_record(native.value()).has_value());
    EXPECT_TRUE(coordinator.get_subgraph(subgraph_id)->disabled);

    auto const next = coordinator.publish_subgraph(me, deployment_id, metadata);
    ASSERT_FALSE(next.has_error());
    EXPECT_NE(next.value(), native.value());
}

TEST_F(Migration, finish_mints_signal_without_tax)
{
    ASSERT_FALSE(receive(subgraph_id, curated_tokens, lock_block_hash)
                     .has_error());
    auto const expected_signal =
        curation.tokens_to_signal_no_tax(deployment_id, curated_tokens).value();

    ASSERT_FALSE(
        coordinator.finish_migration(me, subgraph_id, deployment_id, metadata)
            .has_error());
    EXPECT_TRUE(emitted(
        abi_encode_event_signature("SubgraphPublished(uint256,bytes32,uint32)")));

    auto const subgraph = coordinator.get_subgraph(subgraph_id);
    EXPECT_EQ(subgraph->v_signal, expected_signal);
    EXPECT_EQ(subgraph->deployment_id, deployment_id);
    EXPECT_FALSE(subgraph->disabled);
    EXPECT_EQ(curation.get_deployment_signal(deployment_id), expected_signal);

    auto const record = coordinator.get_migration_record(subgraph_id);
    EXPECT_TRUE(record->l2_done);
    EXPECT_FALSE(record->deprecated);
    EXPECT_EQ(store.tokens_curated, curated_tokens);
}

TEST_F(Migration, finish_rejections)
{
    auto const never = coordinator.finish_migration(
        me, subgraph_id, deployment_id, metadata);
    ASSERT_TRUE(never.has_error());
    EXPECT_EQ(never.assume_error(), MigrationError::NotMigrated);

    ASSERT_FALSE(receive(subgraph_id, curated_tokens, lock_block_hash)
                     .has_error());

    auto const not_owner = coordinator.finish_migration(
        other, subgraph_id, deployment_id, metadata);
    ASSERT_TRUE(not_owner.has_error());
    EXPECT_EQ(not_owner.assume_error(), MigrationError::NotAuthorized);

    auto const zero = coordinator.finish_migration(
        me, subgraph_id, bytes32_t{}, metadata);
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.assume_error(), MigrationError::DeploymentZero);

    curation.signal[deployment_id] = 1;
    auto const pre_curated = coordinator.finish_migration(
        me, subgraph_id, deployment_id, metadata);
    ASSERT_TRUE(pre_curated.has_error());
    EXPECT_EQ(pre_curated.assume_error(), MigrationError::PreCurated);
    EXPECT_TRUE(coordinator.get_subgraph(subgraph_id)->disabled);
}

TEST_F(Migration, finish_twice)
{
    migrate(subgraph_id, curated_tokens, lock_block_hash);
    auto const again = coordinator.finish_migration(
        me, subgraph_id, 0xdf_bytes32, metadata);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.assume_error(), MigrationError::NotMigrated);

    auto const resend = receive(subgraph_id, curated_tokens, lock_block_hash);
    ASSERT_TRUE(resend.has_error());
    EXPECT_EQ(resend.assume_error(), MigrationError::AlreadyFinalized);
}

TEST_F(Migration, counterpart_set_by_governor)
{
    auto const res = coordinator.set_counterpart_address(me, other);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MigrationError::NotAuthorized);
    EXPECT_EQ(coordinator.counterpart(), l1_gns);

    ASSERT_FALSE(
        coordinator.set_counterpart_address(governor, other).has_error());
    EXPECT_EQ(coordinator.counterpart(), other);
    EXPECT_TRUE(emitted(
        abi_encode_event_signature("CounterpartGNSAddressUpdated(address)")));
}

struct MainnetClaim : public Migration
{
    MainnetCuratorProof const &fixture = mainnet_curator_proof();
    byte_string const header_rlp = rlp::encode_block_header(fixture.header);
    byte_string const proof_rlp = mainnet_proof_rlp(fixture.proof);

    void SetUp() override
    {
        Migration::SetUp();
        migrate(fixture.subgraph_id, fixture.curated_tokens, fixture.block_hash);
        ASSERT_FALSE(
            coordinator.set_counterpart_address(governor, fixture.proof.address)
                .has_error());
    }
};

TEST_F(MainnetClaim, verifies_proof_and_credits_curator)
{
    auto const res = coordinator.claim_l1_curator_balance(
        fixture.curator, fixture.subgraph_id, header_rlp, proof_rlp);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 0x1523b25a875df6c79_u256);
    EXPECT_EQ(res.value(), fixture.proof.storage_proof.front().value);
    EXPECT_EQ(
        coordinator.get_curator_signal(fixture.subgraph_id, fixture.curator),
        0x1523b25a875df6c79_u256);

    auto const &event = store.events.back();
    EXPECT_EQ(
        event.topics.front(),
        abi_encode_event_signature(
            "CuratorBalanceClaimed(uint256,address,address,uint256)"));
    EXPECT_EQ(event.topics[1], fixture.subgraph_id);
}

TEST_F(MainnetClaim, second_claim_fails)
{
    ASSERT_FALSE(coordinator
                     .claim_l1_curator_balance(
                         fixture.curator,
                         fixture.subgraph_id,
                         header_rlp,
                         proof_rlp)
                     .has_error());
    auto const again = coordinator.claim_l1_curator_balance(
        fixture.curator, fixture.subgraph_id, header_rlp, proof_rlp);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.assume_error(), MigrationError::AlreadyClaimed);

    // nor through the message path
    auto const relayed = coordinator.claim_l1_curator_balance_to_beneficiary(
        apply_l1_to_l2_alias(fixture.proof.address),
        fixture.subgraph_id,
        fixture.curator,
        1,
        other);
    ASSERT_TRUE(relayed.has_error());
    EXPECT_EQ(relayed.assume_error(), MigrationError::AlreadyClaimed);
    EXPECT_EQ(
        coordinator.get_curator_signal(fixture.subgraph_id, fixture.curator),
        0x1523b25a875df6c79_u256);
}

TEST_F(MainnetClaim, adds_to_existing_balance)
{
    Address const l1_other{0x1234};
    ASSERT_FALSE(coordinator
                     .claim_l1_curator_balance_to_beneficiary(
                         apply_l1_to_l2_alias(fixture.proof.address),
                         fixture.subgraph_id,
                         l1_other,
                         100,
                         fixture.curator)
                     .has_error());
    ASSERT_FALSE(coordinator
                     .claim_l1_curator_balance(
                         fixture.curator,
                         fixture.subgraph_id,
                         header_rlp,
                         proof_rlp)
                     .has_error());
    EXPECT_EQ(
        coordinator.get_curator_signal(fixture.subgraph_id, fixture.curator),
        0x1523b25a875df6c79_u256 + 100);
}

TEST_F(MainnetClaim, proof_for_other_counterpart_fails)
{
    ASSERT_FALSE(
        coordinator.set_counterpart_address(governor, l1_gns).has_error());
    auto const res = coordinator.claim_l1_curator_balance(
        fixture.curator, fixture.subgraph_id, header_rlp, proof_rlp);
    ASSERT_TRUE(res.has_error());
    EXPECT_TRUE(
        res.assume_error() == mpt::ProofError::InvalidNodeHash ||
        res.assume_error() == mpt::ProofError::KeyNotFound);
    EXPECT_FALSE(res.assume_error() == mpt::ProofError::InvalidRootHash);
    EXPECT_EQ(
        coordinator.get_curator_signal(fixture.subgraph_id, fixture.curator),
        0);
}

TEST_F(MainnetClaim, proof_for_other_curator_fails)
{
    auto const res = coordinator.claim_l1_curator_balance(
        other, fixture.subgraph_id, header_rlp, proof_rlp);
    ASSERT_TRUE(res.has_error());
    EXPECT_TRUE(
        res.assume_error() == mpt::ProofError::InvalidNodeHash ||
        res.assume_error() == mpt::ProofError::KeyNotFound);
    EXPECT_FALSE(res.assume_error() == mpt::ProofError::InvalidRootHash);

    // a failed claim does not consume it
    ASSERT_FALSE(coordinator
                     .claim_l1_curator_balance(
                         fixture.curator,
                         fixture.subgraph_id,
                         header_rlp,
                         proof_rlp)
                     .has_error());
}

TEST_F(MainnetClaim, proof_from_different_block_fails_root_hash)
{
    auto const res = coordinator.claim_l1_curator_balance(
        fixture.curator,
        fixture.subgraph_id,
        header_rlp,
        mainnet_proof_rlp(fixture.proof_for_different_block));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), mpt::ProofError::InvalidRootHash);
}

TEST_F(MainnetClaim, header_must_match_lock_block)
{
    auto header = fixture.header;
    header.state_root = 0x01_bytes32;
    auto const res = coordinator.claim_l1_curator_balance(
        fixture.curator,
        fixture.subgraph_id,
        rlp::encode_block_header(header),
        proof_rlp);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), chain::HeaderError::BlockHashMismatch);
}

TEST_F(MainnetClaim, requires_finished_migration)
{
    bytes32_t const pending_id{0x77_bytes32};
    ASSERT_FALSE(
        coordinator
            .on_token_transfer(
                gateway,
                fixture.proof.address,
                curated_tokens,
                callhook(pending_id, fixture.block_hash, n_signal))
            .has_error());

    auto const res = coordinator.claim_l1_curator_balance(
        fixture.curator, pending_id, header_rlp, proof_rlp);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), MigrationError::NotMigrated);
}

TEST_F(Migration, claim_to_beneficiary)
{
    migrate(subgraph_id, curated_tokens, lock_block_hash);
    Address const alias = apply_l1_to_l2_alias(l1_gns);

    ASSERT_FALSE(coordinator
                     .claim_l1_curator_balance_to_beneficiary(
                         alias, subgraph_id, me, 10, other)
                     .has_error());
    EXPECT_EQ(coordinator.get_curator_signal(subgraph_id, other), 10);
    EXPECT_EQ(coordinator.get_curator_signal(subgraph_id, me), 0);

    auto const again = coordinator.claim_l1_curator_balance_to_beneficiary(
        alias, subgraph_id, me, 10, other);
    ASSERT_TRUE(again.has_error());
    EXPECT_EQ(again.assume_error(), MigrationError::AlreadyClaimed);
    EXPECT_EQ(coordinator.get_curator_signal(subgraph_id, other), 10);
}

TEST_F(Migration, claim_to_beneficiary_only_from_alias)
{
    migrate(subgraph_id, curated_tokens, lock_block_hash);
    for (auto const &caller : {me, l1_gns, gateway}) {
        auto const res = coordinator.claim_l1_curator_balance_to_beneficiary(
            caller, subgraph_id, me, 10, other);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), MigrationError::OnlyCounterpartAlias);
    }
}

TEST_F(Migration, claim_to_beneficiary_requires_migrated_subgraph)
{
    Address const alias = apply_l1_to_l2_alias(l1_gns);

    auto const absent = coordinator.claim_l1_curator_balance_to_beneficiary(
        alias, subgraph_id, me, 10, other);
    ASSERT_TRUE(absent.has_error());
    EXPECT_EQ(absent.assume_error(), MigrationError::NotMigrated);

    auto const native =
        coordinator.publish_subgraph(me, deployment_id, metadata);
    ASSERT_FALSE(native.has_error());
    auto const on_native = coordinator.claim_l1_curator_balance_to_beneficiary(
        alias, native.value(), me, 10, other);
    ASSERT_TRUE(on_native.has_error());
    EXPECT_EQ(on_native.assume_error(), MigrationError::NotMigrated);

    ASSERT_FALSE(receive(subgraph_id, curated_tokens, lock_block_hash)
                     .has_error());
    auto const pending = coordinator.claim_l1_curator_balance_to_beneficiary(
        alias, subgraph_id, me, 10, other);
    ASSERT_TRUE(pending.has_error());
    EXPECT_EQ(pending.assume_error(), MigrationError::NotMigrated);
}
