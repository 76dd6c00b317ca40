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

#include <cstdint>

VAULT_NAMESPACE_BEGIN

class State;

///////////////////
// Compact slots //
///////////////////
struct AssetClock
{
    Address asset;
    u64_be last_update;
};

static_assert(StorageVariable<AssetClock>::N == 1);

// Pool is the ledger record of one deposit asset. The pool balance itself is
// never stored here: it is read from the custody adapter on every use.
class Pool
{
    State &state_;
    Address const &address_;
    uint256_t const key_;

public:
    ////////////
    // Layout //
    ////////////
    using TotalShares_t = u256_be;
    using AccRewardPerShare_t = u256_be;
    using RewardRate_t = u256_be;
    using Stranded_t = u256_be;
    using AssetClock_t = AssetClock;
    using RewardAsset_t = Address;

    struct Offsets
    {
        static constexpr size_t total_shares = 0;
        static constexpr size_t acc_reward_per_share =
            total_shares + StorageVariable<TotalShares_t>::N;
        static constexpr size_t reward_rate =
            acc_reward_per_share + StorageVariable<AccRewardPerShare_t>::N;
        static constexpr size_t stranded =
            reward_rate + StorageVariable<RewardRate_t>::N;
        static constexpr size_t asset_clock =
            stranded + StorageVariable<Stranded_t>::N;
        static constexpr size_t reward_asset =
            asset_clock + StorageVariable<AssetClock_t>::N;
    };

    Pool(State &state, Address const &address, bytes32_t const key);

    /////////////
    // Getters //
    /////////////

    // sum of the shares of every live position
    StorageVariable<TotalShares_t> total_shares() noexcept
    {
        return {state_, address_, key_ + Offsets::total_shares};
    }

    // reward earned by one share since the pool was created, scaled by
    // REWARD_PRECISION. Never decreases.
    StorageVariable<AccRewardPerShare_t> acc_reward_per_share() noexcept
    {
        return {state_, address_, key_ + Offsets::acc_reward_per_share};
    }

    // reward asset units emitted per second across all shares
    StorageVariable<RewardRate_t> reward_rate() noexcept
    {
        return {state_, address_, key_ + Offsets::reward_rate};
    }

    // custody balance present when the pool was last empty of shares. It is
    // excluded from share conversions and never allocated to a position.
    StorageVariable<Stranded_t> stranded() noexcept
    {
        return {state_, address_, key_ + Offsets::stranded};
    }

    // low level getter returning the packed asset and clock. prefer the
    // helpers below.
    StorageVariable<AssetClock_t> asset_clock() noexcept
    {
        return {state_, address_, key_ + Offsets::asset_clock};
    }

    StorageVariable<RewardAsset_t> reward_asset() noexcept
    {
        return {state_, address_, key_ + Offsets::reward_asset};
    }

    /////////////
    // Helpers //
    /////////////

    Address get_asset() const noexcept
    {
        return StorageVariable<AssetClock_t>(
                   state_, address_, key_ + Offsets::asset_clock)
            .load()
            .asset;
    }

    // timestamp the accumulator was last advanced to
    uint64_t get_last_update() const noexcept
    {
        return StorageVariable<AssetClock_t>(
                   state_, address_, key_ + Offsets::asset_clock)
            .load()
            .last_update.native();
    }

    void set_last_update(uint64_t const now) noexcept
    {
        auto ac = asset_clock().load();
        ac.last_update = now;
        asset_clock().store(ac);
    }

    bool exists() const noexcept
    {
        return get_asset() != Address{};
    }
};

// Custody accounts of a pool, one per asset it holds.
Address deposit_custody(u64_be pool_id) noexcept;
Address reward_custody(u64_be pool_id) noexcept;

VAULT_NAMESPACE_END
