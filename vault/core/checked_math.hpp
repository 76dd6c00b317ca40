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
#include <vault/core/likely.h>
#include <vault/core/result.hpp>

#include <initializer_list>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

VAULT_NAMESPACE_BEGIN

enum class MathError
{
    Success = 0,
    Overflow,
    Underflow,
    DivisionByZero,
};

Result<uint256_t> checked_add(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_sub(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_mul(uint256_t const &x, uint256_t const &y);
Result<uint256_t> checked_div(uint256_t const &x, uint256_t const &y);

// floor(x * y / z). The product is formed at 512 bits so only a quotient that
// does not fit in 256 bits overflows.
Result<uint256_t>
checked_mul_div(uint256_t const &x, uint256_t const &y, uint256_t const &z);

VAULT_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<vault::MathError>
    : quick_status_code_from_enum_defaults<vault::MathError>
{
    static constexpr auto const domain_name = "Math Error";
    static constexpr auto const domain_uuid =
        "6f1d2c7e-93a4-4b1e-8d0a-52c9e1f7b3a6";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
