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

#include <vault/core/checked_math.hpp>
#include <vault/core/likely.h>
#include <vault/pool/pool.hpp>
#include <vault/pool/share_ledger.hpp>
#include <vault/pool/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

VAULT_NAMESPACE_BEGIN

Result<uint256_t> preview_mint(
    Pool &pool, uint256_t const &amount, uint256_t const &pool_balance)
{
    if (VAULT_UNLIKELY(amount == 0)) {
        return VaultError::InvalidAmount;
    }

    uint256_t const total_shares = pool.total_shares().load().native();
    if (total_shares == 0) {
        // bootstrap: seed 1:1
        return amount;
    }

    BOOST_OUTCOME_TRY(
        auto const effective_balance,
        checked_sub(pool_balance, pool.stranded().load().native()));
    BOOST_OUTCOME_TRY(
        auto const shares,
        checked_mul_div(amount, total_shares, effective_balance));
    if (VAULT_UNLIKELY(shares == 0)) {
        return VaultError::InvalidAmount;
    }
    return shares;
}

Result<uint256_t> preview_burn(
    Pool &pool, uint256_t const &shares, uint256_t const &pool_balance)
{
    if (VAULT_UNLIKELY(shares == 0)) {
        return VaultError::InvalidAmount;
    }

    uint256_t const total_shares = pool.total_shares().load().native();
    if (VAULT_UNLIKELY(shares > total_shares)) {
        return VaultError::InsufficientShares;
    }

    BOOST_OUTCOME_TRY(
        auto const effective_balance,
        checked_sub(pool_balance, pool.stranded().load().native()));
    BOOST_OUTCOME_TRY(
        auto const amount,
        checked_mul_div(shares, effective_balance, total_shares));
    if (VAULT_UNLIKELY(amount == 0)) {
        return VaultError::InvalidAmount;
    }
    return amount;
}

Result<uint256_t> mint_shares(
    Pool &pool, uint256_t const &amount, uint256_t const &pool_balance)
{
    BOOST_OUTCOME_TRY(
        auto const shares, preview_mint(pool, amount, pool_balance));

    uint256_t const total_shares = pool.total_shares().load().native();
    if (total_shares == 0) {
        // whatever custody already holds belongs to no one
        pool.stranded().store(pool_balance);
    }
    BOOST_OUTCOME_TRY(
        auto const new_total_shares, checked_add(total_shares, shares));
    pool.total_shares().store(new_total_shares);
    return shares;
}

Result<uint256_t> burn_shares(
    Pool &pool, uint256_t const &shares, uint256_t const &pool_balance)
{
    BOOST_OUTCOME_TRY(
        auto const amount, preview_burn(pool, shares, pool_balance));

    BOOST_OUTCOME_TRY(
        auto const new_total_shares,
        checked_sub(pool.total_shares().load().native(), shares));
    pool.total_shares().store(new_total_shares);
    return amount;
}

VAULT_NAMESPACE_END
