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
#include <vault/core/config.hpp>
#include <vault/core/int.hpp>
#include <vault/core/result.hpp>
#include <vault/custody/state_custody.hpp>
#include <vault/pool/vault_contract.hpp>
#include <vault/state/log.hpp>
#include <vault/state/state.hpp>

#include <cstdint>
#include <mutex>
#include <string_view>
#include <vector>

VAULT_NAMESPACE_BEGIN

// Acting identity and current time of an operation
struct CallContext
{
    Address sender;
    uint64_t timestamp;
};

// Applies vault operations atomically: every state write, custody transfer
// and event of an operation is kept if it succeeds and discarded if it fails.
// Operations are serialized, which is a valid total order for every pool.
class VaultHost
{
    mutable std::mutex mutex_;
    State state_;
    StateCustody custody_;
    VaultContract contract_;

    template <typename Op>
    auto execute(std::string_view name, Op &&op);

public:
    VaultHost();

    VaultHost(VaultHost const &) = delete;
    VaultHost &operator=(VaultHost const &) = delete;

    Result<u64_be> initialize_pool(
        CallContext const &, Address const &asset,
        Address const &reward_asset);

    Result<uint256_t>
    deposit(CallContext const &, u64_be pool_id, uint256_t const &amount);

    Result<uint256_t>
    withdraw(CallContext const &, u64_be pool_id, uint256_t const &shares);

    Result<void> fund_rewards(
        CallContext const &, u64_be pool_id, uint256_t const &amount,
        uint256_t const &rate);

    Result<uint256_t> claim_rewards(CallContext const &, u64_be pool_id);

    // credit a principal with `amount` of `asset`
    Result<void>
    mint(Address const &asset, Address const &to, uint256_t const &amount);

    ///////////
    // Views //
    ///////////

    Result<VaultContract::PoolInfo> get_pool(u64_be pool_id);

    Result<u64_be> get_pool_id(Address const &asset);

    Result<VaultContract::PositionInfo>
    get_position(u64_be pool_id, Address const &owner);

    Result<uint256_t> preview_deposit(u64_be pool_id, uint256_t const &amount);

    Result<uint256_t> preview_withdraw(u64_be pool_id, uint256_t const &shares);

    Result<uint256_t>
    pending_rewards(u64_be pool_id, Address const &owner, uint64_t now);

    uint256_t balance_of(Address const &asset, Address const &account) const;

    std::vector<Log> logs() const;
};

VAULT_NAMESPACE_END
