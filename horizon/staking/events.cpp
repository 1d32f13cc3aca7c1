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
#include <horizon/staking/config.hpp>
#include <horizon/staking/events.hpp>
#include <horizon/staking/store.hpp>
#include <horizon/staking/util/constants.hpp>

#include <cstdint>

HORIZON_STAKING_NAMESPACE_BEGIN

void emit_stake_deposited_event(
    StakingStore &store, Address const &provider, uint256_t const &tokens)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("HorizonStakeDeposited(address,uint256)");
    static_assert(
        signature ==
        0x48c384dd8bdf1e06d8afecd810c4acfc3d553ac5d879dec5a69875dbbd90e14b_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_stake_withdrawn_event(
    StakingStore &store, Address const &provider, uint256_t const &tokens)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("HorizonStakeWithdrawn(address,uint256)");
    static_assert(
        signature ==
        0x32eed9ebc5696170068a371fdbea4c076da1bc21b305e78ca0a5e65ee913be83_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_stake_locked_event(
    StakingStore &store, Address const &provider, uint256_t const &tokens,
    uint64_t const until)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("StakeLocked(address,uint256,uint256)");
    static_assert(
        signature ==
        0xa5ae833d0bb1dcd632d98a8b70973e8516812898e19bf27b70071ebc8dc52c01_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_data(abi_encode_uint(tokens))
                           .add_data(abi_encode_uint(until))
                           .build();
    store.emit_log(event);
}

void emit_legacy_stake_withdrawn_event(
    StakingStore &store, Address const &provider, uint256_t const &tokens)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("StakeWithdrawn(address,uint256)");
    static_assert(
        signature ==
        0x8108595eb6bad3acefa9da467d90cc2217686d5c5ac85460f8b7849c840645fc_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_stake_migrated_event(
    StakingStore &store, Address const &provider, uint256_t const &tokens)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("StakeMigratedToL2(address,uint256)");
    static_assert(
        signature ==
        0x755e11cfc0481e402dc0cf8c01d7a71920ba307c5e91f0f791b0fdd4a0e606b4_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_provision_created_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint256_t const &tokens, uint32_t const max_verifier_cut,
    uint64_t const thawing_period)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ProvisionCreated(address,address,uint256,uint32,uint64)");
    static_assert(
        signature ==
        0x88b4c2d08cea0f01a24841ff5d14814ddb5b14ac44b05e0835fcc0dcd8c7bc25_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(tokens))
                           .add_data(abi_encode_uint(max_verifier_cut))
                           .add_data(abi_encode_uint(thawing_period))
                           .build();
    store.emit_log(event);
}

void emit_provision_increased_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ProvisionIncreased(address,address,uint256)");
    static_assert(
        signature ==
        0xeaf6ea3a42ed2fd1b6d575f818cbda593af9524aa94bd30e65302ac4dc234745_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_provision_thawed_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("ProvisionThawed(address,address,uint256)");
    static_assert(
        signature ==
        0x3b81913739097ced1e7fa748c6058d34e2c00b961fb501094543b397b198fdaa_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_tokens_deprovisioned_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "TokensDeprovisioned(address,address,uint256)");
    static_assert(
        signature ==
        0x9008d731ddfbec70bc364780efd63057c6877bee8027c4708a104b365395885d_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_provision_parameters_staged_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint32_t const max_verifier_cut, uint64_t const thawing_period)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ProvisionParametersStaged(address,address,uint32,uint64)");
    static_assert(
        signature ==
        0xe89cbb9d63ba60af555547b12dde6817283e88cbdd45feb2059f2ba71ea346ba_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(max_verifier_cut))
                           .add_data(abi_encode_uint(thawing_period))
                           .build();
    store.emit_log(event);
}

void emit_provision_parameters_set_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint32_t const max_verifier_cut, uint64_t const thawing_period)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ProvisionParametersSet(address,address,uint32,uint64)");
    static_assert(
        signature ==
        0xa4c005afae9298a5ca51e7710c334ac406fb3d914588ade970850f917cedb1c6_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(max_verifier_cut))
                           .add_data(abi_encode_uint(thawing_period))
                           .build();
    store.emit_log(event);
}

void emit_provision_slashed_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    constexpr bytes32_t signature =
        abi_encode_event_signature("ProvisionSlashed(address,address,uint256)");
    static_assert(
        signature ==
        0xe7b110f13cde981d5079ab7faa4249c5f331f5c292dbc6031969d2ce694188a3_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_verifier_tokens_sent_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    Address const &destination, uint256_t const &tokens)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "VerifierTokensSent(address,address,address,uint256)");
    static_assert(
        signature ==
        0x95ff4196cd75fa49180ba673948ea43935f59e7c4ba101fa09b9fe0ec266d582_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_topic(abi_encode_address(destination))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_delegation_slashed_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "DelegationSlashed(address,address,uint256)");
    static_assert(
        signature ==
        0xc5d16dbb577cf07678b577232717c9a606197a014f61847e623d47fc6bf6b771_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_delegation_slashing_skipped_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "DelegationSlashingSkipped(address,address,uint256)");
    static_assert(
        signature ==
        0xdce44f0aeed2089c75db59f5a517b9a19a734bf0213412fa129f0d0434126b24_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_tokens_delegated_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    Address const &delegator, uint256_t const &tokens, uint256_t const &shares)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "TokensDelegated(address,address,address,uint256,uint256)");
    static_assert(
        signature ==
        0x237818af8bb47710142edd8fc301fbc507064fb357cf122fb161ca447e3cb13e_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_topic(abi_encode_address(delegator))
                           .add_data(abi_encode_uint(tokens))
                           .add_data(abi_encode_uint(shares))
                           .build();
    store.emit_log(event);
}

void emit_tokens_undelegated_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    Address const &delegator, uint256_t const &tokens, uint256_t const &shares)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "TokensUndelegated(address,address,address,uint256,uint256)");
    static_assert(
        signature ==
        0x0525d6ad1aa78abc571b5c1984b5e1ea4f1412368c1cc348ca408dbb1085c9a1_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_topic(abi_encode_address(delegator))
                           .add_data(abi_encode_uint(tokens))
                           .add_data(abi_encode_uint(shares))
                           .build();
    store.emit_log(event);
}

void emit_delegated_tokens_withdrawn_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    Address const &delegator, uint256_t const &tokens)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "DelegatedTokensWithdrawn(address,address,address,uint256)");
    static_assert(
        signature ==
        0x305f519d8909c676ffd870495d4563032eb0b506891a6dd9827490256cc9914e_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_topic(abi_encode_address(delegator))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_tokens_to_delegation_pool_added_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    uint256_t const &tokens)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "TokensToDelegationPoolAdded(address,address,uint256)");
    static_assert(
        signature ==
        0x673007a04e501145e79f59aea5e0413b6e88344fdaf10326254530d6a1511530_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_data(abi_encode_uint(tokens))
                           .build();
    store.emit_log(event);
}

void emit_thaw_request_created_event(
    StakingStore &store, Address const &provider, Address const &verifier,
    Address const &owner, uint256_t const &shares,
    uint64_t const thawing_until, bytes32_t const &id)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ThawRequestCreated(address,address,address,uint256,uint64,bytes32)");
    static_assert(
        signature ==
        0x434422e55cc9ab3bcca23cbf515724bbad83af8dd645832a1abd3db5e641dea5_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(abi_encode_address(provider))
                           .add_topic(abi_encode_address(verifier))
                           .add_topic(abi_encode_address(owner))
                           .add_data(abi_encode_uint(shares))
                           .add_data(abi_encode_uint(thawing_until))
                           .add_data(id)
                           .build();
    store.emit_log(event);
}

void emit_thaw_request_fulfilled_event(
    StakingStore &store, bytes32_t const &id, uint256_t const &tokens,
    uint256_t const &shares, uint64_t const thawing_until, bool const valid)
{
    constexpr bytes32_t signature = abi_encode_event_signature(
        "ThawRequestFulfilled(bytes32,uint256,uint256,uint64,bool)");
    static_assert(
        signature ==
        0xbe7f1ad13b07d1f0e9574e97c844204d5433e4ab98133a1f0ce257764a6abeb7_bytes32);

    auto const event = EventBuilder(STAKING_CA, signature)
                           .add_topic(id)
                           .add_data(abi_encode_uint(tokens))
                           .add_data(abi_encode_uint(shares))
                           .add_data(abi_encode_uint(thawing_until))
                           .add_data(abi_encode_bool(valid))
                           .build();
    store.emit_log(event);
}

HORIZON_STAKING_NAMESPACE_END
