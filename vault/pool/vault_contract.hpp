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

#include <vault/core/address.hpp>
#include <vault/core/big_endian.hpp>
#include <vault/core/bytes.hpp>
#include <vault/core/config.hpp>
#include <vault/core/int.hpp>
#include <vault/core/result.hpp>
#include <vault/pool/constants.hpp>
#include <vault/pool/pool.hpp>
#include <vault/pool/position.hpp>
#include <vault/pool/vault_error.hpp>
#include <vault/state/storage_variable.hpp>

#include <bit>
#include <cstdint>

VAULT_NAMESPACE_BEGIN

class CustodyAdapter;
class State;

class VaultContract
{
    State &state_;
    CustodyAdapter &custody_;

public:
    VaultContract(State &, CustodyAdapter &);

    struct PoolInfo
    {
        Address asset;
        Address reward_asset;
        uint256_t total_shares;
        uint256_t acc_reward_per_share;
        uint256_t reward_rate;
        uint64_t last_update;
        uint256_t stranded;
        uint256_t pool_balance;
        uint256_t reward_balance;
    };

    struct PositionInfo
    {
        Address owner;
        u64_be pool_id;
        uint256_t shares;
        uint256_t reward_debt;
        uint256_t pending_reward;
    };

    ///////////////////////////
    // Vault Storage Variables
    ///////////////////////////
    class Variables
    {
        State &state_;

        // Single slot constants all under namespace 0x0
        static constexpr auto AddressLastPoolId{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

        // Namespaces for mappings. Each mapping "owns" all the address space
        // under the namespace byte.
        enum Namespace : uint8_t
        {
            NSPoolId = 0x01,
            NSPool = 0x02,
            NSPosition = 0x03,
        };

    public:
        explicit Variables(State &state)
            : state_{state}
        {
        }

        // Increments every time a pool is initialized. First pool ID is 1.
        StorageVariable<u64_be> last_pool_id{
            state_, VAULT_CA, AddressLastPoolId};

        // mapping (address => uint64) pool_id
        //
        // At most one pool per deposit asset.
        StorageVariable<u64_be> pool_id(Address const &asset) noexcept
        {
            struct
            {
                uint8_t ns;
                Address address;
                uint8_t slots[11];
            } key{.ns = NSPoolId, .address = asset, .slots = {}};

            return {state_, VAULT_CA, std::bit_cast<bytes32_t>(key)};
        }

        // mapping (uint64 => Pool) pool
        Pool pool(u64_be const id) noexcept
        {
            struct
            {
                uint8_t ns;
                u64_be pool_id;
                uint8_t slots[23];
            } key{.ns = NSPool, .pool_id = id, .slots = {}};

            return {state_, VAULT_CA, std::bit_cast<bytes32_t>(key)};
        }

        // mapping (uint64 => mapping (address => Position)) position
        Position position(u64_be const id, Address const &owner) noexcept
        {
            struct
            {
                uint8_t ns;
                u64_be pool_id;
                Address address;
                uint8_t slots[3];
            } key{
                .ns = NSPosition,
                .pool_id = id,
                .address = owner,
                .slots = {}};

            return {state_, VAULT_CA, std::bit_cast<bytes32_t>(key)};
        }
    } vars;

    ////////////////
    // Operations //
    ////////////////

    // Registers a pool for `asset` paying rewards in `reward_asset`, with its
    // clock starting at `now`. Returns the new pool id.
    Result<u64_be> initialize_pool(
        Address const &asset, Address const &reward_asset, uint64_t now);

    // Returns the shares minted to `owner`.
    Result<uint256_t> deposit(
        u64_be pool_id, Address const &owner, uint256_t const &amount,
        uint64_t now);

    // Returns the deposit asset paid to `owner`.
    Result<uint256_t> withdraw(
        u64_be pool_id, Address const &owner, uint256_t const &shares,
        uint64_t now);

    // Moves `amount` of reward asset from `funder` into reward custody and
    // sets the emission rate from `now` onward.
    Result<void> fund_rewards(
        u64_be pool_id, Address const &funder, uint256_t const &amount,
        uint256_t const &rate, uint64_t now);

    // Returns the reward paid to `owner`, possibly zero.
    Result<uint256_t>
    claim_rewards(u64_be pool_id, Address const &owner, uint64_t now);

    ///////////
    // Views //
    ///////////

    Result<PoolInfo> get_pool(u64_be pool_id);

    Result<u64_be> get_pool_id(Address const &asset);

    // UnknownPosition for a position that was never opened or was closed
    Result<PositionInfo> get_position(u64_be pool_id, Address const &owner);

    Result<uint256_t> preview_deposit(u64_be pool_id, uint256_t const &amount);

    Result<uint256_t> preview_withdraw(u64_be pool_id, uint256_t const &shares);

    // pending reward plus what settling at `now` would add
    Result<uint256_t>
    pending_rewards(u64_be pool_id, Address const &owner, uint64_t now);

private:
    void close_if_empty(Position &);

    // Moves `amount` into `custody` and fails with TransferShortfall unless
    // the custody balance grew by exactly that much.
    Result<void> transfer_in_confirmed(
        Address const &asset, Address const &from, Address const &custody,
        uint256_t const &amount);

    ////////////
    // Events //
    ////////////
    void emit_pool_initialized_event(
        u64_be pool_id, Address const &asset, Address const &reward_asset);
    void emit_deposit_event(
        u64_be pool_id, Address const &owner, uint256_t const &amount,
        uint256_t const &shares);
    void emit_withdraw_event(
        u64_be pool_id, Address const &owner, uint256_t const &shares,
        uint256_t const &amount);
    void emit_rewards_funded_event(
        u64_be pool_id, Address const &funder, uint256_t const &amount,
        uint256_t const &rate);
    void emit_rewards_claimed_event(
        u64_be pool_id, Address const &owner, uint256_t const &amount);
};

VAULT_NAMESPACE_END
