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

#include <horizon/core/address.hpp>
#include <horizon/core/bytes.hpp>
#include <horizon/core/contract/abi_encode.hpp>
#include <horizon/core/contract/abi_signatures.hpp>
#include <horizon/core/contract/events.hpp>
#include <horizon/core/int.hpp>
#include <horizon/migration/config.hpp>
#include <horizon/migration/constants.hpp>
#include <horizon/migration/events.hpp>
#include <horizon/migration/types.hpp>

#include <cstdint>

HORIZON_MIGRATION_NAMESPACE_BEGIN

void emit_subgraph_received_from_l1_event(
    MigrationStore &store, bytes32_t const &subgraph_id, Address const &owner,
    uint256_t const &tokens)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "SubgraphReceivedFromL1(uint256,address,uint256)");
    static_assert(
        signature ==
        0xd0fb508550a45e41e6d14a10128499b50d3f1a417ad85dd96674e9f560e10bf1_bytes32);

    auto const event = EventBuilder(GNS_CA, signature)
                           .add_topic(subgraph_id)
                           .add_topic(abi_encode_address(owner))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_subgraph_metadata_updated_event(
    MigrationStore &store, bytes32_t const &subgraph_id,
    bytes32_t const &metadata)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("SubgraphMetadataUpdated(uint256,bytes32)");
    static_assert(
        signature ==
        0xd0348d353ba9da6b560ddf6465c3faf849b78869806be8900a829c064b8d4b21_bytes32);

    auto const event = EventBuilder(GNS_CA, signature)
                           .add_topic(subgraph_id)
                           .add_data(metadata)
                           .build();
    store.emit_log(event);
}

void emit_subgraph_published_event(
    MigrationStore &store, bytes32_t const &subgraph_id,
    bytes32_t const &deployment_id, uint32_t reserve_ratio)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("SubgraphPublished(uint256,bytes32,uint32)");
    static_assert(
        signature ==
        0x42a544925af95c7d50835f669fa06cc226acbf9eea3d0cb552b1b09bc8901426_bytes32);

    auto const event = EventBuilder(GNS_CA, signature)
                           .add_topic(subgraph_id)
                           .add_topic(deployment_id)
                           .add_data(abi_encode_uint(reserve_ratio))
                           .build();
    store.emit_log(event);
}

void emit_subgraph_migration_finalized_event(
    MigrationStore &store, bytes32_t const &subgraph_id)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("SubgraphMigrationFinalized(uint256)");
    static_assert(
        signature ==
        0x55fe66e82b6932401adebd2813e2d01f83ffe5151446f7779f25f6830690bbad_bytes32);

    auto const event = EventBuilder(GNS_CA, signature)
                           .add_topic(subgraph_id)
                           .build();
    store.emit_log(event);
}

void emit_curator_balance_claimed_event(
    MigrationStore &store, bytes32_t const &subgraph_id,
    Address const &l1_curator, Address const &l2_curator,
    uint256_t const &n_signal)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "CuratorBalanceClaimed(uint256,address,address,uint256)");
    static_assert(
        signature ==
        0xf484d6d91d2e965ff52c959128f60a4216e138d2a3bfcd20e27e569fa7681641_bytes32);

    auto const event = EventBuilder(GNS_CA, signature)
                           .add_topic(subgraph_id)
                           .add_topic(abi_encode_address(l1_curator))
                           .add_topic(abi_encode_address(l2_curator))
                           .add_data(abi_encode_uint(n_signal))
                           .build();
    store.emit_log(event);
}

void emit_counterpart_gns_address_updated_event(
    MigrationStore &store, Address const &counterpart)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("CounterpartGNSAddressUpdated(address)");
    static_assert(
        signature ==
        0x4ce4c2262a11970f8ffd6d6d1ff56c1524511bcc3c7fdeacc617cac4ea32f941_bytes32);

    auto const event = EventBuilder(GNS_CA, signature)
                           .add_data(abi_encode_address(counterpart))
                           .build();
    store.emit_log(event);
}
HORIZON_MIGRATION_NAMESPACE_END
