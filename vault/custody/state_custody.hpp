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
#include <vault/core/config.hpp>
#include <vault/core/int.hpp>
#include <vault/core/result.hpp>
#include <vault/custody/custody_adapter.hpp>

VAULT_NAMESPACE_BEGIN

class State;

// Custody backed by the asset balances of the host state, so that transfers
// roll back together with the operation that issued them.
class StateCustody final : public CustodyAdapter
{
    State &state_;

    Result<void> move(
        Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount);

public:
    explicit StateCustody(State &);

    Result<void> transfer_in(
        Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount) override;

    Result<void> transfer_out(
        Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount) override;

    uint256_t
    balance_of(Address const &asset, Address const &account) const override;

    // credit `amount` out of thin air, used to seed principals
    Result<void>
    mint(Address const &asset, Address const &to, uint256_t const &amount);
};

VAULT_NAMESPACE_END
