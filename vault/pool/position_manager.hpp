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

#include <vault/core/config.hpp>
#include <vault/core/int.hpp>
#include <vault/core/result.hpp>

#include <cstdint>

VAULT_NAMESPACE_BEGIN

class Pool;
class Position;

// Reward a position has earned between its last settlement and an
// accumulator value `acc`:
//   floor(shares * acc / REWARD_PRECISION)
//     - floor(reward_debt / REWARD_PRECISION)
Result<uint256_t> accrued_rewards(Position &, uint256_t const &acc);

// Advance the pool to `now`, move the position's accrued reward into its
// pending reward and re-baseline its debt. Returns the amount moved. Settling
// twice at the same `now` accrues nothing the second time.
Result<uint256_t> settle(Pool &, Position &, uint64_t now);

// Reset the debt to shares * acc after the share count changed, so the new
// shares do not claim reward accrued before they existed.
Result<void> rebaseline(Pool &, Position &);

VAULT_NAMESPACE_END
