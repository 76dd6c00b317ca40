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
#include <vault/pool/constants.hpp>
#include <vault/pool/pool.hpp>
#include <vault/pool/position.hpp>
#include <vault/pool/position_manager.hpp>
#include <vault/pool/reward_accumulator.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

VAULT_NAMESPACE_BEGIN

Result<uint256_t> accrued_rewards(Position &position, uint256_t const &acc)
{
    uint256_t const shares = position.shares().load().native();
    uint256_t const debt = position.reward_debt().load().native();

    BOOST_OUTCOME_TRY(
        auto const earned, checked_mul_div(shares, acc, REWARD_PRECISION));
    return checked_sub(earned, debt / REWARD_PRECISION);
}

Result<uint256_t> settle(Pool &pool, Position &position, uint64_t const now)
{
    BOOST_OUTCOME_TRY(advance(pool, now));

    uint256_t const acc = pool.acc_reward_per_share().load().native();
    BOOST_OUTCOME_TRY(auto const accrued, accrued_rewards(position, acc));
    if (accrued != 0) {
        BOOST_OUTCOME_TRY(
            auto const pending,
            checked_add(
                position.pending_reward().load().native(), accrued));
        position.pending_reward().store(pending);
    }
    BOOST_OUTCOME_TRY(rebaseline(pool, position));
    return accrued;
}

Result<void> rebaseline(Pool &pool, Position &position)
{
    BOOST_OUTCOME_TRY(
        auto const debt,
        checked_mul(
            position.shares().load().native(),
            pool.acc_reward_per_share().load().native()));
    position.reward_debt().store(debt);
    return outcome::success();
}

VAULT_NAMESPACE_END
