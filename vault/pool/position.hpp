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
#include <vault/state/storage_variable.hpp>

VAULT_NAMESPACE_BEGIN

class State;

struct OwnerPool
{
    Address owner;
    u64_be pool_id;
};

static_assert(StorageVariable<OwnerPool>::N == 1);

// A struct in state holding one owner's stake in one pool. The owner slot
// doubles as the existence marker: a closed position has every slot zeroed.
class Position
{
    State &state_;
    Address const &address_;
    uint256_t const key_;

public:
    ////////////
    // Layout //
    ////////////
    using OwnerPool_t = OwnerPool;
    using Shares_t = u256_be;
    using RewardDebt_t = u256_be;
    using PendingReward_t = u256_be;

    struct Offsets
    {
        static constexpr size_t owner_pool = 0;
        static constexpr size_t shares =
            owner_pool + StorageVariable<OwnerPool_t>::N;
        static constexpr size_t reward_debt =
            shares + StorageVariable<Shares_t>::N;
        static constexpr size_t pending_reward =
            reward_debt + StorageVariable<RewardDebt_t>::N;
    };

    Position(State &state, Address const &address, bytes32_t const key);

    /////////////
    // Getters //
    /////////////

    StorageVariable<OwnerPool_t> owner_pool() noexcept
    {
        return {state_, address_, key_ + Offsets::owner_pool};
    }

    StorageVariable<Shares_t> shares() noexcept
    {
        return {state_, address_, key_ + Offsets::shares};
    }

    // shares * acc_reward_per_share at the last settlement, kept scaled
    StorageVariable<RewardDebt_t> reward_debt() noexcept
    {
        return {state_, address_, key_ + Offsets::reward_debt};
    }

    // settled but not yet paid out
    StorageVariable<PendingReward_t> pending_reward() noexcept
    {
        return {state_, address_, key_ + Offsets::pending_reward};
    }

    /////////////
    // Helpers //
    /////////////

    bool exists() const noexcept
    {
        return StorageVariable<OwnerPool_t>(
                   state_, address_, key_ + Offsets::owner_pool)
            .load_checked()
            .has_value();
    }

    void open(Address const &owner, u64_be const pool_id) noexcept
    {
        owner_pool().store(OwnerPool{.owner = owner, .pool_id = pool_id});
    }

    // reclaim every slot
    void close() noexcept
    {
        owner_pool().clear();
        shares().clear();
        reward_debt().clear();
        pending_reward().clear();
    }
};

VAULT_NAMESPACE_END
