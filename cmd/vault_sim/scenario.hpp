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
#include <vault/core/big_endian.hpp>
#include <vault/core/config.hpp>
#include <vault/core/int.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

VAULT_NAMESPACE_BEGIN

class VaultHost;

enum class StepOp
{
    InitPool,
    Mint,
    Deposit,
    Withdraw,
    FundRewards,
    ClaimRewards,
    PendingRewards,
};

// One line of a scenario file. `amount` is the deposit or funding amount, or
// the shares to burn for a withdrawal.
struct Step
{
    StepOp op;
    Address sender{};
    uint64_t time{0};
    Address asset{};
    Address reward_asset{};
    uint64_t pool_id{0};
    uint256_t amount{0};
    uint256_t rate{0};
    std::optional<std::string> expect_error{};
};

// Throws std::invalid_argument or nlohmann::json::exception on malformed
// input.
Step parse_step(nlohmann::json const &);
std::vector<Step> parse_scenario(nlohmann::json const &);

struct StepResult
{
    std::string error; // empty on success
    uint256_t value;
};

class ScenarioRunner
{
    VaultHost &host_;
    std::vector<u64_be> pools_;
    std::vector<Address> assets_;
    std::vector<Address> accounts_;

    void track(Step const &);

public:
    explicit ScenarioRunner(VaultHost &);

    StepResult apply(Step const &);

    // Applies every step in order. Returns false if any step did not fail
    // or succeed as it expected to.
    bool run(std::vector<Step> const &);

    // pools, their positions and the balances of every account seen so far
    nlohmann::json dump();
};

VAULT_NAMESPACE_END
