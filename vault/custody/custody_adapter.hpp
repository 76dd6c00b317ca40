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

VAULT_NAMESPACE_BEGIN

// Moves assets between principals and custody accounts on instruction from
// the vault. A transfer either moves exactly `amount` or fails and moves
// nothing.
class CustodyAdapter
{
public:
    virtual ~CustodyAdapter() = default;

    // principal -> custody account
    virtual Result<void> transfer_in(
        Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount) = 0;

    // custody account -> principal
    virtual Result<void> transfer_out(
        Address const &asset, Address const &from, Address const &to,
        uint256_t const &amount) = 0;

    virtual uint256_t
    balance_of(Address const &asset, Address const &account) const = 0;
};

VAULT_NAMESPACE_END
