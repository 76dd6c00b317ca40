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
#include <vault/pool/constants.hpp>
#include <vault/pool/pool.hpp>
#include <vault/pool/reward_accumulator.hpp>
#include <vault/pool/vault_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

VAULT_NAMESPACE_BEGIN

Result<uint256_t> accumulator_at(Pool &pool, uint64_t const now)
{
    uint64_t const last_update = pool.get_last_update();
    uint256_t const acc = pool.acc_reward_per_share().load().native();
    if (VAULT_UNLIKELY(now < last_update)) {
        return VaultError::ClockRewind;
    }
    if (now == last_update) {
        return acc;
    }

    uint256_t const total_shares = pool.total_shares().load().native();
    if (total_shares == 0) {
        return acc;
    }

    uint256_t const elapsed{now - last_update};
    BOOST_OUTCOME_TRY(
        auto const emitted,
        checked_mul(elapsed, pool.reward_rate().load().native()));
    BOOST_OUTCOME_TRY(
        auto const delta,
        checked_mul_div(emitted, REWARD_PRECISION, total_shares));
    return checked_add(acc, delta);
}

Result<void> advance(Pool &pool, uint64_t const now)
{
    BOOST_OUTCOME_TRY(auto const acc, accumulator_at(pool, now));
    if (now == pool.get_last_update()) {
        return outcome::success();
    }
    pool.acc_reward_per_share().store(acc);
    pool.set_last_update(now);
    return outcome::success();
}

VAULT_NAMESPACE_END
