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
#include <horizon/core/bytes.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/mpt/compact_encode.hpp>
#include <horizon/mpt/proof.hpp>
#include <horizon/mpt/proof_error.hpp>
#include <horizon/rlp/decode_error.hpp>
#include <horizon/rlp/encode2.hpp>
#include <horizon/rlp/int_rlp.hpp>
#include <horizon/test_util/mainnet_fixture.hpp>
#include <horizon/test_util/trie_builder.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <vector>

using namespace horizon;
using namespace horizon::mpt;
using namespace horizon::test;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    byte_string hashed(bytes32_t const &key)
    {
        auto const h = keccak256(to_byte_string_view(key.bytes));
        return byte_string{h.bytes, sizeof(h.bytes)};
    }

    byte_string value_of(uint256_t const &v)
    {
        return rlp::encode_unsigned(v);
    }
}

TEST(CompactEncode, prefixes)
{
    EXPECT_EQ(
        compact_encode(byte_string{1, 2, 3, 4, 5}, false),
        byte_string({0x11, 0x23, 0x45}));
    EXPECT_EQ(
        compact_encode(byte_string{0, 1, 2, 3, 4, 5}, false),
        byte_string({0x00, 0x01, 0x23, 0x45}));
    EXPECT_EQ(
        compact_encode(byte_string{0, 0xf, 1, 0xc, 0xb, 8}, true),
        byte_string({0x20, 0x0f, 0x1c, 0xb8}));
    EXPECT_EQ(
        compact_encode(byte_string{0xf, 1, 0xc, 0xb, 8}, true),
        byte_string({0x3f, 0x1c, 0xb8}));
    EXPECT_EQ(compact_encode(byte_string{}, true), byte_string({0x20}));
}

TEST(CompactEncode, decode)
{
    auto const odd_leaf = compact_decode(byte_string{0x3f, 0x1c, 0xb8});
    ASSERT_TRUE(odd_leaf.has_value());
    EXPECT_TRUE(odd_leaf.value().terminating);
    EXPECT_EQ(odd_leaf.value().nibbles, byte_string({0xf, 1, 0xc, 0xb, 8}));

    auto const even_ext = compact_decode(byte_string{0x00, 0x01, 0x23});
    ASSERT_TRUE(even_ext.has_value());
    EXPECT_FALSE(even_ext.value().terminating);
    EXPECT_EQ(even_ext.value().nibbles, byte_string({0, 1, 2, 3}));

    auto const bad_flag = compact_decode(byte_string{0x40, 0x01});
    ASSERT_TRUE(bad_flag.has_error());
    EXPECT_EQ(bad_flag.assume_error(), ProofError::InvalidNode);

    auto const bad_padding = compact_decode(byte_string{0x21, 0x01});
    ASSERT_TRUE(bad_padding.has_error());
    EXPECT_EQ(bad_padding.assume_error(), ProofError::InvalidNode);
}

struct ProofTest : public ::testing::Test
{
    TrieBuilder trie;
    std::vector<bytes32_t> slots;

    void SetUp() override
    {
        for (uint64_t i = 1; i <= 40; ++i) {
            slots.push_back(to_bytes(uint256_t{i}));
            trie.put(hashed(slots.back()), value_of(uint256_t{i * 1000}));
        }
    }
};

TEST_F(ProofTest, every_key_verifies)
{
    auto const root = trie.root();
    for (size_t i = 0; i < slots.size(); ++i) {
        auto const proof = trie.prove(hashed(slots[i]));
        auto const value = get_storage_value(root, slots[i], proof);
        ASSERT_TRUE(value.has_value()) << i;
        EXPECT_EQ(value.value(), uint256_t{(i + 1) * 1000});
    }
}

TEST_F(ProofTest, single_leaf_trie)
{
    TrieBuilder single;
    auto const slot = to_bytes(uint256_t{7});
    single.put(hashed(slot), value_of(42));
    auto const proof = single.prove(hashed(slot));
    ASSERT_EQ(proof.size(), 1);
    EXPECT_EQ(get_storage_value(single.root(), slot, proof).value(), 42);
}

TEST_F(ProofTest, wrong_root)
{
    auto const proof = trie.prove(hashed(slots[0]));
    auto const res = get_storage_value(NULL_HASH, slots[0], proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ProofError::InvalidRootHash);
}

TEST_F(ProofTest, proof_for_other_key)
{
    auto const proof = trie.prove(hashed(slots[0]));
    auto const res = get_storage_value(trie.root(), slots[1], proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_TRUE(
        res.assume_error() == ProofError::InvalidNodeHash ||
        res.assume_error() == ProofError::KeyNotFound);
}

TEST_F(ProofTest, absent_key)
{
    auto const absent = to_bytes(uint256_t{9999});
    auto const proof = trie.prove(hashed(absent));
    ASSERT_FALSE(proof.empty());
    auto const res = get_storage_value(trie.root(), absent, proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_TRUE(
        res.assume_error() == ProofError::InvalidNodeHash ||
        res.assume_error() == ProofError::KeyNotFound);
}

TEST_F(ProofTest, truncated_proof)
{
    auto proof = trie.prove(hashed(slots[3]));
    ASSERT_GT(proof.size(), 1);
    proof.pop_back();
    auto const res = get_storage_value(trie.root(), slots[3], proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ProofError::KeyNotFound);
}

TEST_F(ProofTest, tampered_inner_node)
{
    auto proof = trie.prove(hashed(slots[3]));
    ASSERT_GT(proof.size(), 1);
    proof[1][proof[1].size() - 2] ^= 0x01;
    auto const res = get_storage_value(trie.root(), slots[3], proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ProofError::InvalidNodeHash);
}

TEST_F(ProofTest, trailing_node_after_leaf)
{
    auto proof = trie.prove(hashed(slots[3]));
    proof.push_back(proof.back());
    auto const res = get_storage_value(trie.root(), slots[3], proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ProofError::InvalidNode);
}

TEST_F(ProofTest, malformed_node)
{
    std::vector<byte_string> proof{byte_string{0xc3, 0x01, 0x02, 0x03}};
    bytes32_t const root = to_bytes(keccak256(proof[0]));
    auto const res = verify_proof(root, hashed(slots[0]), proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ProofError::InvalidNode);

    std::vector<byte_string> garbage{byte_string{0xf9, 0x01}};
    auto const res2 =
        verify_proof(to_bytes(keccak256(garbage[0])), hashed(slots[0]), garbage);
    ASSERT_TRUE(res2.has_error());
    EXPECT_EQ(res2.assume_error(), rlp::DecodeError::InputTooShort);
}

TEST(Proof, empty_proof)
{
    std::vector<byte_string> const proof;
    auto const empty = verify_proof(NULL_ROOT, byte_string{0x01}, proof);
    ASSERT_TRUE(empty.has_error());
    EXPECT_EQ(empty.assume_error(), ProofError::KeyNotFound);

    auto const nonempty = verify_proof(NULL_HASH, byte_string{0x01}, proof);
    ASSERT_TRUE(nonempty.has_error());
    EXPECT_EQ(nonempty.assume_error(), ProofError::InvalidRootHash);
}

TEST(Proof, account_then_storage)
{
    TrieBuilder storage;
    auto const slot = to_bytes(uint256_t{3});
    storage.put(hashed(slot), value_of(0x1523b25a875df6c79_u256));

    constexpr auto address = 0xadca0dd4729c8ba3acf3e99f3a9f471ef37b6825_address;
    Account const account{
        .nonce = 1,
        .balance = 0,
        .storage_root = storage.root(),
        .code_hash = NULL_HASH};

    TrieBuilder state;
    auto const address_key = keccak256(to_byte_string_view(address.bytes));
    byte_string const address_path{address_key.bytes, 32};
    state.put(address_path, rlp::encode_account(account));
    for (uint64_t i = 0; i < 8; ++i) {
        state.put(hashed(to_bytes(uint256_t{i})), rlp::encode_unsigned(i + 1));
    }

    auto const account_proof = state.prove(address_path);
    auto const storage_root =
        get_account_storage_root(state.root(), address, account_proof);
    ASSERT_TRUE(storage_root.has_value());
    EXPECT_EQ(storage_root.value(), storage.root());

    auto const value =
        get_storage_value(storage_root.value(), slot, storage.prove(hashed(slot)));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 0x1523b25a875df6c79_u256);
}

TEST(MainnetProof, account_and_storage)
{
    auto const &fixture = mainnet_curator_proof();
    auto const &proof = fixture.proof;

    auto const account =
        get_account(fixture.header.state_root, proof.address, proof.account_proof);
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(account.value().nonce, proof.nonce);
    EXPECT_EQ(account.value().balance, proof.balance);
    EXPECT_EQ(account.value().storage_root, proof.storage_hash);
    EXPECT_EQ(account.value().code_hash, proof.code_hash);

    ASSERT_EQ(proof.storage_proof.size(), 1);
    auto const &storage = proof.storage_proof.front();
    auto const value =
        get_storage_value(proof.storage_hash, storage.key, storage.proof);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), storage.value);
    EXPECT_EQ(value.value(), 0x1523b25a875df6c79_u256);
}

TEST(MainnetProof, other_slot_fails_node_hash)
{
    auto const &fixture = mainnet_curator_proof();
    auto const &storage = fixture.proof.storage_proof.front();
    auto const other_slot = to_bytes(uint256_t{1});
    auto const res =
        get_storage_value(fixture.proof.storage_hash, other_slot, storage.proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ProofError::InvalidNodeHash);
}

TEST(MainnetProof, proof_from_different_block_fails_root_hash)
{
    auto const &fixture = mainnet_curator_proof();
    auto const &other = fixture.proof_for_different_block;
    auto const res = get_account_storage_root(
        fixture.header.state_root, other.address, other.account_proof);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ProofError::InvalidRootHash);
}
