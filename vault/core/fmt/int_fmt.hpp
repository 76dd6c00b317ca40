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

#include <vault/core/basic_formatter.hpp>
#include <vault/core/int.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <algorithm>

// Amounts, shares and accumulator values are logged as decimal uint256_t.
template <>
struct quill::copy_loggable<vault::uint256_t> : std::true_type
{
};

template <>
struct fmt::formatter<vault::uint256_t> : public vault::BasicFormatter
{
    template <typename FormatContext>
    auto format(vault::uint256_t const &value, FormatContext &ctx) const
    {
        auto const digits = intx::to_string(value);
        return std::copy(digits.begin(), digits.end(), ctx.out());
    }
};
