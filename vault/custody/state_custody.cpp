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

#include <vault/custody/state_custody.hpp>

#include <vault/core/address.hpp>
#include <vault/core/checked_math.hpp>
#include <vault/core/config.hpp>
#include <vault/core/int.hpp>
#include <vault/core/result.hpp>
#include <vault/custody/custody_error.hpp>
#include <vault/state/state.hpp>

#include <boost/outcome/try.hpp>

VAULT_NAMESPACE_BEGIN

StateCustody::StateCustody(State &state)
    : state_{state}
{
}

Result<void> StateCustody::move(
    Address const &asset, Address const &from, Address const &to,
    uint256_t const &amount)
{
    if (state_.get_balance(asset, from) < amount) {
        return CustodyError::InsufficientBalance;
    }
    if (from == to) {
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(checked_add(state_.get_balance(asset, to), amount));
    state_.subtract_from_balance(asset, from, amount);
    state_.add_to_balance(asset, to, amount);
    return outcome::success();
}

Result<void> StateCustody::transfer_in(
    Address const &asset, Address const &from, Address const &to,
    uint256_t const &amount)
{
    return move(asset, from, to, amount);
}

Result<void> StateCustody::transfer_out(
    Address const &asset, Address const &from, Address const &to,
    uint256_t const &amount)
{
    return move(asset, from, to, amount);
}

uint256_t
StateCustody::balance_of(Address const &asset, Address const &account) const
{
    return state_.get_balance(asset, account);
}

Result<void> StateCustody::mint(
    Address const &asset, Address const &to, uint256_t const &amount)
{
    BOOST_OUTCOME_TRY(checked_add(state_.get_balance(asset, to), amount));
    state_.add_to_balance(asset, to, amount);
    return outcome::success();
}

VAULT_NAMESPACE_END
