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

VAULT_NAMESPACE_BEGIN

class Pool;

// Conversions between deposit asset and pool shares. `pool_balance` is the
// deposit custody balance read before the operation moves any asset. Every
// conversion rounds down, in favor of the pool.

// shares minted for depositing `amount`, without mutating the pool
Result<uint256_t>
preview_mint(Pool &, uint256_t const &amount, uint256_t const &pool_balance);

// asset paid out for burning `shares`, without mutating the pool
Result<uint256_t>
preview_burn(Pool &, uint256_t const &shares, uint256_t const &pool_balance);

Result<uint256_t>
mint_shares(Pool &, uint256_t const &amount, uint256_t const &pool_balance);

Result<uint256_t>
burn_shares(Pool &, uint256_t const &shares, uint256_t const &pool_balance);

VAULT_NAMESPACE_END
