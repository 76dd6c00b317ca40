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

#include <vault/pool/constants.hpp>
#include <vault/pool/pool.hpp>
#include <vault/state/state.hpp>

#include <intx/intx.hpp>

#include <bit>

VAULT_ANONYMOUS_NAMESPACE_BEGIN

Address custody_address(uint8_t const ns, u64_be const pool_id) noexcept
{
    struct
    {
        uint8_t ns;
        u64_be pool_id;
        uint8_t pad[11];
    } key{.ns = ns, .pool_id = pool_id, .pad = {}};

    static_assert(sizeof(key) == sizeof(Address));
    return std::bit_cast<Address>(key);
}

VAULT_ANONYMOUS_NAMESPACE_END

VAULT_NAMESPACE_BEGIN

Pool::Pool(State &state, Address const &address, bytes32_t const key)
    : state_{state}
    , address_{address}
    , key_{intx::be::load<uint256_t>(key)}
{
}

Address deposit_custody(u64_be const pool_id) noexcept
{
    return custody_address(CUSTODY_NS_DEPOSIT, pool_id);
}

Address reward_custody(u64_be const pool_id) noexcept
{
    return custody_address(CUSTODY_NS_REWARD, pool_id);
}

VAULT_NAMESPACE_END
