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

// Value acc_reward_per_share would hold if the pool were advanced to `now`.
// Fails with ClockRewind if `now` precedes the last update.
Result<uint256_t> accumulator_at(Pool &, uint64_t now);

// Advance the pool's accumulator to `now`. A no-op when `now` equals the last
// update. The clock moves even while the pool holds no shares, so reward time
// spent empty is never credited to a later depositor.
Result<void> advance(Pool &, uint64_t now);

VAULT_NAMESPACE_END
