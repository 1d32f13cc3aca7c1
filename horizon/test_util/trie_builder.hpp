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

#include <horizon/core/byte_string.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/keccak.hpp>
#include <horizon/mpt/compact_encode.hpp>
#include <horizon/mpt/nibbles.hpp>
#include <horizon/mpt/node_reference.hpp>
#include <horizon/rlp/encode2.hpp>

#include <algorithm>
#include <cstddef>
#include <map>
#include <span>
#include <vector>

namespace horizon::test
{
    // Minimal in-memory Merkle Patricia trie, enough to produce roots and
    // inclusion proofs for tests. Keys are used as given; hash them first to
    // build a secure trie.
    class TrieBuilder
    {
        std::map<mpt::Nibbles, byte_string> leaves_;

        using Entry = std::map<mpt::Nibbles, byte_string>::value_type;

        static size_t
        common_prefix(std::span<Entry const *const> entries, size_t depth)
        {
            auto const &first = entries.front()->first;
            size_t len = first.size() - depth;
            for (auto const *e : entries) {
                size_t i = 0;
                while (i < len && e->first[depth + i] == first[depth + i]) {
                    ++i;
                }
                len = i;
            }
            return len;
        }

        static byte_string child_slot(byte_string const &child)
        {
            auto const ref = mpt::to_node_reference(child);
            if (ref.size() < sizeof(bytes32_t)) {
                return ref;
            }
            return rlp::encode_string2(ref);
        }

        // Returns the encoding of the node covering entries at depth. When
        // key is covered by this node, its proof path is appended.
        static byte_string build(
            std::span<Entry const *const> entries, size_t const depth,
            mpt::Nibbles const *key, std::vector<byte_string> &proof)
        {
            size_t const slot = proof.size();
            byte_string node;
            if (entries.size() == 1) {
                auto const &e = *entries.front();
                node = rlp::encode_list2(
                    rlp::encode_string2(mpt::compact_encode(
                        byte_string_view{e.first}.substr(depth), true)),
                    rlp::encode_string2(e.second));
            }
            else if (size_t const prefix = common_prefix(entries, depth);
                     prefix > 0) {
                auto const &path = entries.front()->first;
                bool const on_path = key && key->substr(depth, prefix) ==
                                                path.substr(depth, prefix);
                auto const child = build(
                    entries, depth + prefix, on_path ? key : nullptr, proof);
                node = rlp::encode_list2(
                    rlp::encode_string2(mpt::compact_encode(
                        byte_string_view{path}.substr(depth, prefix), false)),
                    child_slot(child));
            }
            else {
                std::vector<byte_string> slots(17, byte_string{0x80});
                for (unsigned char n = 0; n < 16; ++n) {
                    std::vector<Entry const *> group;
                    for (auto const *e : entries) {
                        if (e->first[depth] == n) {
                            group.push_back(e);
                        }
                    }
                    if (group.empty()) {
                        continue;
                    }
                    bool const on_path = key && (*key)[depth] == n;
                    slots[n] = child_slot(build(
                        group, depth + 1, on_path ? key : nullptr, proof));
                }
                node = rlp::encode_list2(slots);
            }
            if (key) {
                proof.insert(
                    proof.begin() + static_cast<std::ptrdiff_t>(slot), node);
            }
            return node;
        }

        byte_string root_node(
            mpt::Nibbles const *key, std::vector<byte_string> &proof) const
        {
            std::vector<Entry const *> entries;
            for (auto const &e : leaves_) {
                entries.push_back(&e);
            }
            return build(entries, 0, key, proof);
        }

    public:
        // value is stored as the leaf payload
        void put(byte_string_view const key, byte_string_view const value)
        {
            leaves_[mpt::to_nibbles(key)] = byte_string{value};
        }

        bytes32_t root() const
        {
            std::vector<byte_string> unused;
            return to_bytes(keccak256(root_node(nullptr, unused)));
        }

        std::vector<byte_string> prove(byte_string_view const key) const
        {
            auto const nibbles = mpt::to_nibbles(key);
            std::vector<byte_string> proof;
            root_node(&nibbles, proof);
            return proof;
        }
    };
}
