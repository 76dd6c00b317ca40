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
#include <vault/core/bytes.hpp>
#include <vault/core/config.hpp>
#include <vault/core/int.hpp>

#include <cstdint>

#include <intx/intx.hpp>

VAULT_NAMESPACE_BEGIN

using namespace intx::literals;

// Fixed point scale of the reward-per-share accumulator. Part of the storage
// format: changing it requires migrating every stored accumulator and debt.
inline constexpr uint256_t REWARD_PRECISION{1000000000000_u256}; // 1e12

// account owning all vault storage
inline constexpr Address VAULT_CA{0x2000};

// custody account namespaces, see deposit_custody() and reward_custody()
inline constexpr uint8_t CUSTODY_NS_DEPOSIT{0xCA};
inline constexpr uint8_t CUSTODY_NS_REWARD{0xCB};

// first topic of every vault event
struct EventId
{
    static constexpr auto POOL_INITIALIZED{
        0x7661756c74000000000000000000000000000000000000000000000000000001_bytes32};
    static constexpr auto DEPOSIT{
        0x7661756c74000000000000000000000000000000000000000000000000000002_bytes32};
    static constexpr auto WITHDRAW{
        0x7661756c74000000000000000000000000000000000000000000000000000003_bytes32};
    static constexpr auto REWARDS_FUNDED{
        0x7661756c74000000000000000000000000000000000000000000000000000004_bytes32};
    static constexpr auto REWARDS_CLAIMED{
        0x7661756c74000000000000000000000000000000000000000000000000000005_bytes32};
};

VAULT_NAMESPACE_END
