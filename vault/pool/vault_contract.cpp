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

#include <vault/core/address.hpp>
#include <vault/core/byte_string.hpp>
#include <vault/core/bytes.hpp>
#include <vault/core/checked_math.hpp>
#include <vault/core/fmt/address_fmt.hpp>
#include <vault/core/fmt/int_fmt.hpp>
#include <vault/core/int.hpp>
#include <vault/core/likely.h>
#include <vault/custody/custody_adapter.hpp>
#include <vault/pool/constants.hpp>
#include <vault/pool/pool.hpp>
#include <vault/pool/position.hpp>
#include <vault/pool/position_manager.hpp>
#include <vault/pool/reward_accumulator.hpp>
#include <vault/pool/share_ledger.hpp>
#include <vault/pool/vault_contract.hpp>
#include <vault/pool/vault_error.hpp>
#include <vault/state/log.hpp>
#include <vault/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <cstring>

VAULT_ANONYMOUS_NAMESPACE_BEGIN

// 32 byte big endian word
bytes32_t encode_uint(uint256_t const &value)
{
    return intx::be::store<bytes32_t>(value);
}

// address right aligned in a 32 byte word
bytes32_t encode_address(Address const &address)
{
    bytes32_t word{};
    std::memcpy(
        word.bytes + sizeof(bytes32_t) - sizeof(Address),
        address.bytes,
        sizeof(Address));
    return word;
}

VAULT_ANONYMOUS_NAMESPACE_END

VAULT_NAMESPACE_BEGIN

VaultContract::VaultContract(State &state, CustodyAdapter &custody)
    : state_{state}
    , custody_{custody}
    , vars{state}
{
}

void VaultContract::close_if_empty(Position &position)
{
    if (position.shares().load().native() == 0 &&
        position.pending_reward().load().native() == 0) {
        position.close();
    }
}

Result<void> VaultContract::transfer_in_confirmed(
    Address const &asset, Address const &from, Address const &custody,
    uint256_t const &amount)
{
    uint256_t const before = custody_.balance_of(asset, custody);
    BOOST_OUTCOME_TRY(custody_.transfer_in(asset, from, custody, amount));
    BOOST_OUTCOME_TRY(auto const expected, checked_add(before, amount));
    if (VAULT_UNLIKELY(custody_.balance_of(asset, custody) != expected)) {
        return VaultError::TransferShortfall;
    }
    return outcome::success();
}

////////////
// Events //
////////////

void VaultContract::emit_pool_initialized_event(
    u64_be const pool_id, Address const &asset, Address const &reward_asset)
{
    auto const event =
        EventBuilder(VAULT_CA, EventId::POOL_INITIALIZED)
            .add_topic(encode_uint(pool_id.native()))
            .add_topic(encode_address(asset))
            .add_data(to_byte_string_view(encode_address(reward_asset).bytes))
            .build();
    state_.store_log(event);
}

void VaultContract::emit_deposit_event(
    u64_be const pool_id, Address const &owner, uint256_t const &amount,
    uint256_t const &shares)
{
    auto const event = EventBuilder(VAULT_CA, EventId::DEPOSIT)
                           .add_topic(encode_uint(pool_id.native()))
                           .add_topic(encode_address(owner))
                           .add_data(
                               to_byte_string_view(encode_uint(amount).bytes))
                           .add_data(
                               to_byte_string_view(encode_uint(shares).bytes))
                           .build();
    state_.store_log(event);
}

void VaultContract::emit_withdraw_event(
    u64_be const pool_id, Address const &owner, uint256_t const &shares,
    uint256_t const &amount)
{
    auto const event = EventBuilder(VAULT_CA, EventId::WITHDRAW)
                           .add_topic(encode_uint(pool_id.native()))
                           .add_topic(encode_address(owner))
                           .add_data(
                               to_byte_string_view(encode_uint(shares).bytes))
                           .add_data(
                               to_byte_string_view(encode_uint(amount).bytes))
                           .build();
    state_.store_log(event);
}

void VaultContract::emit_rewards_funded_event(
    u64_be const pool_id, Address const &funder, uint256_t const &amount,
    uint256_t const &rate)
{
    auto const event = EventBuilder(VAULT_CA, EventId::REWARDS_FUNDED)
                           .add_topic(encode_uint(pool_id.native()))
                           .add_topic(encode_address(funder))
                           .add_data(
                               to_byte_string_view(encode_uint(amount).bytes))
                           .add_data(
                               to_byte_string_view(encode_uint(rate).bytes))
                           .build();
    state_.store_log(event);
}

void VaultContract::emit_rewards_claimed_event(
    u64_be const pool_id, Address const &owner, uint256_t const &amount)
{
    auto const event = EventBuilder(VAULT_CA, EventId::REWARDS_CLAIMED)
                           .add_topic(encode_uint(pool_id.native()))
                           .add_topic(encode_address(owner))
                           .add_data(
                               to_byte_string_view(encode_uint(amount).bytes))
                           .build();
    state_.store_log(event);
}

////////////////
// Operations //
////////////////

Result<u64_be> VaultContract::initialize_pool(
    Address const &asset, Address const &reward_asset, uint64_t const now)
{
    if (VAULT_UNLIKELY(
            asset == Address{} || reward_asset == Address{} ||
            asset == reward_asset)) {
        return VaultError::InvalidAsset;
    }
    auto pool_id_slot = vars.pool_id(asset);
    if (VAULT_UNLIKELY(pool_id_slot.load_checked().has_value())) {
        return VaultError::PoolExists;
    }

    u64_be const pool_id = vars.last_pool_id.load().native() + 1;
    vars.last_pool_id.store(pool_id);
    pool_id_slot.store(pool_id);

    auto pool = vars.pool(pool_id);
    pool.asset_clock().store(AssetClock{.asset = asset, .last_update = now});
    pool.reward_asset().store(reward_asset);

    LOG_INFO(
        "VaultContract: initialized pool {} for asset {} rewarding {}",
        pool_id.native(),
        asset,
        reward_asset);
    emit_pool_initialized_event(pool_id, asset, reward_asset);
    return pool_id;
}

Result<uint256_t> VaultContract::deposit(
    u64_be const pool_id, Address const &owner, uint256_t const &amount,
    uint64_t const now)
{
    if (VAULT_UNLIKELY(amount == 0)) {
        return VaultError::InvalidAmount;
    }
    auto pool = vars.pool(pool_id);
    if (VAULT_UNLIKELY(!pool.exists())) {
        return VaultError::UnknownPool;
    }

    auto position = vars.position(pool_id, owner);
    BOOST_OUTCOME_TRY(settle(pool, position, now));

    Address const asset = pool.get_asset();
    Address const custody = deposit_custody(pool_id);
    uint256_t const balance_before = custody_.balance_of(asset, custody);
    BOOST_OUTCOME_TRY(
        auto const minted, mint_shares(pool, amount, balance_before));

    BOOST_OUTCOME_TRY(transfer_in_confirmed(asset, owner, custody, amount));

    if (!position.exists()) {
        position.open(owner, pool_id);
    }
    BOOST_OUTCOME_TRY(
        auto const shares,
        checked_add(position.shares().load().native(), minted));
    position.shares().store(shares);
    BOOST_OUTCOME_TRY(rebaseline(pool, position));

    emit_deposit_event(pool_id, owner, amount, minted);
    return minted;
}

Result<uint256_t> VaultContract::withdraw(
    u64_be const pool_id, Address const &owner, uint256_t const &shares,
    uint64_t const now)
{
    if (VAULT_UNLIKELY(shares == 0)) {
        return VaultError::InvalidAmount;
    }
    auto pool = vars.pool(pool_id);
    if (VAULT_UNLIKELY(!pool.exists())) {
        return VaultError::UnknownPool;
    }
    auto position = vars.position(pool_id, owner);
    if (VAULT_UNLIKELY(!position.exists())) {
        return VaultError::UnknownPosition;
    }

    BOOST_OUTCOME_TRY(settle(pool, position, now));

    uint256_t const held = position.shares().load().native();
    if (VAULT_UNLIKELY(shares > held)) {
        return VaultError::InsufficientShares;
    }

    Address const asset = pool.get_asset();
    Address const custody = deposit_custody(pool_id);
    BOOST_OUTCOME_TRY(
        auto const amount,
        burn_shares(pool, shares, custody_.balance_of(asset, custody)));
    BOOST_OUTCOME_TRY(custody_.transfer_out(asset, custody, owner, amount));

    position.shares().store(held - shares);
    BOOST_OUTCOME_TRY(rebaseline(pool, position));
    // reward still pending keeps the position open until it is claimed
    close_if_empty(position);

    emit_withdraw_event(pool_id, owner, shares, amount);
    return amount;
}

Result<void> VaultContract::fund_rewards(
    u64_be const pool_id, Address const &funder, uint256_t const &amount,
    uint256_t const &rate, uint64_t const now)
{
    if (VAULT_UNLIKELY(amount == 0)) {
        return VaultError::InvalidAmount;
    }
    auto pool = vars.pool(pool_id);
    if (VAULT_UNLIKELY(!pool.exists())) {
        return VaultError::UnknownPool;
    }

    // the old rate applies up to now, the new one from now on
    BOOST_OUTCOME_TRY(advance(pool, now));

    BOOST_OUTCOME_TRY(transfer_in_confirmed(
        pool.reward_asset().load(), funder, reward_custody(pool_id), amount));
    pool.reward_rate().store(rate);

    LOG_INFO(
        "VaultContract: funded pool {} with {} at rate {}",
        pool_id.native(),
        amount,
        rate);
    emit_rewards_funded_event(pool_id, funder, amount, rate);
    return outcome::success();
}

Result<uint256_t> VaultContract::claim_rewards(
    u64_be const pool_id, Address const &owner, uint64_t const now)
{
    auto pool = vars.pool(pool_id);
    if (VAULT_UNLIKELY(!pool.exists())) {
        return VaultError::UnknownPool;
    }
    auto position = vars.position(pool_id, owner);
    if (VAULT_UNLIKELY(!position.exists())) {
        return VaultError::UnknownPosition;
    }

    BOOST_OUTCOME_TRY(settle(pool, position, now));

    uint256_t const paid = position.pending_reward().load().native();
    if (paid != 0) {
        Address const reward_asset = pool.reward_asset().load();
        Address const custody = reward_custody(pool_id);
        if (VAULT_UNLIKELY(
                custody_.balance_of(reward_asset, custody) < paid)) {
            return VaultError::InsufficientRewardBalance;
        }
        BOOST_OUTCOME_TRY(
            custody_.transfer_out(reward_asset, custody, owner, paid));
        position.pending_reward().clear();
        emit_rewards_claimed_event(pool_id, owner, paid);
    }

    close_if_empty(position);
    return paid;
}

///////////
// Views //
///////////

Result<VaultContract::PoolInfo> VaultContract::get_pool(u64_be const pool_id)
{
    auto pool = vars.pool(pool_id);
    if (VAULT_UNLIKELY(!pool.exists())) {
        return VaultError::UnknownPool;
    }

    auto const asset_clock = pool.asset_clock().load();
    Address const reward_asset = pool.reward_asset().load();
    return PoolInfo{
        .asset = asset_clock.asset,
        .reward_asset = reward_asset,
        .total_shares = pool.total_shares().load().native(),
        .acc_reward_per_share = pool.acc_reward_per_share().load().native(),
        .reward_rate = pool.reward_rate().load().native(),
        .last_update = asset_clock.last_update.native(),
        .stranded = pool.stranded().load().native(),
        .pool_balance =
            custody_.balance_of(asset_clock.asset, deposit_custody(pool_id)),
        .reward_balance =
            custody_.balance_of(reward_asset, reward_custody(pool_id))};
}

Result<u64_be> VaultContract::get_pool_id(Address const &asset)
{
    auto const pool_id = vars.pool_id(asset).load_checked();
    if (VAULT_UNLIKELY(!pool_id.has_value())) {
        return VaultError::UnknownPool;
    }
    return pool_id.value();
}

Result<VaultContract::PositionInfo>
VaultContract::get_position(u64_be const pool_id, Address const &owner)
{
    auto position = vars.position(pool_id, owner);
    auto const owner_pool = position.owner_pool().load_checked();
    if (VAULT_UNLIKELY(!owner_pool.has_value())) {
        return VaultError::UnknownPosition;
    }
    return PositionInfo{
        .owner = owner_pool->owner,
        .pool_id = owner_pool->pool_id,
        .shares = position.shares().load().native(),
        .reward_debt = position.reward_debt().load().native(),
        .pending_reward = position.pending_reward().load().native()};
}

Result<uint256_t>
VaultContract::preview_deposit(u64_be const pool_id, uint256_t const &amount)
{
    auto pool = vars.pool(pool_id);
    if (VAULT_UNLIKELY(!pool.exists())) {
        return VaultError::UnknownPool;
    }
    return preview_mint(
        pool,
        amount,
        custody_.balance_of(pool.get_asset(), deposit_custody(pool_id)));
}

Result<uint256_t>
VaultContract::preview_withdraw(u64_be const pool_id, uint256_t const &shares)
{
    auto pool = vars.pool(pool_id);
    if (VAULT_UNLIKELY(!pool.exists())) {
        return VaultError::UnknownPool;
    }
    return preview_burn(
        pool,
        shares,
        custody_.balance_of(pool.get_asset(), deposit_custody(pool_id)));
}

Result<uint256_t> VaultContract::pending_rewards(
    u64_be const pool_id, Address const &owner, uint64_t const now)
{
    auto pool = vars.pool(pool_id);
    if (VAULT_UNLIKELY(!pool.exists())) {
        return VaultError::UnknownPool;
    }
    auto position = vars.position(pool_id, owner);
    if (VAULT_UNLIKELY(!position.exists())) {
        return VaultError::UnknownPosition;
    }

    BOOST_OUTCOME_TRY(auto const acc, accumulator_at(pool, now));
    BOOST_OUTCOME_TRY(auto const accrued, accrued_rewards(position, acc));
    return checked_add(position.pending_reward().load().native(), accrued);
}

VAULT_NAMESPACE_END
