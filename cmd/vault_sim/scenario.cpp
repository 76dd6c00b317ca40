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

#include "scenario.hpp"

#include <vault/core/address.hpp>
#include <vault/core/big_endian.hpp>
#include <vault/core/fmt/int_fmt.hpp>
#include <vault/core/int.hpp>
#include <vault/core/result.hpp>
#include <vault/pool/pool.hpp>
#include <vault/pool/vault_host.hpp>

#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

VAULT_ANONYMOUS_NAMESPACE_BEGIN

std::unordered_map<std::string, StepOp> const STEP_OP_MAP = {
    {"init_pool", StepOp::InitPool},
    {"mint", StepOp::Mint},
    {"deposit", StepOp::Deposit},
    {"withdraw", StepOp::Withdraw},
    {"fund_rewards", StepOp::FundRewards},
    {"claim_rewards", StepOp::ClaimRewards},
    {"pending_rewards", StepOp::PendingRewards}};

Address parse_address(nlohmann::json const &value)
{
    auto const address = evmc::from_hex<Address>(value.get<std::string>());
    if (!address.has_value()) {
        throw std::invalid_argument{
            "invalid address " + value.get<std::string>()};
    }
    return address.value();
}

uint256_t parse_uint(nlohmann::json const &value)
{
    return intx::from_string<uint256_t>(value.get<std::string>());
}

std::string to_hex(Address const &address)
{
    return "0x" + evmc::hex(evmc::bytes_view{address.bytes, sizeof(address.bytes)});
}

std::string to_dec(uint256_t const &value)
{
    return intx::to_string(value, 10);
}

template <typename T>
void insert_unique(std::vector<T> &v, T const &value)
{
    if (std::find(v.begin(), v.end(), value) == v.end()) {
        v.push_back(value);
    }
}

template <typename T>
StepResult to_step_result(Result<T> const &res)
{
    if (res.has_error()) {
        return {.error = res.error().message().c_str(), .value = 0};
    }
    if constexpr (std::is_same_v<T, u64_be>) {
        return {.error = {}, .value = res.value().native()};
    }
    else if constexpr (std::is_same_v<T, uint256_t>) {
        return {.error = {}, .value = res.value()};
    }
    else {
        return {.error = {}, .value = 0};
    }
}

VAULT_ANONYMOUS_NAMESPACE_END

VAULT_NAMESPACE_BEGIN

Step parse_step(nlohmann::json const &json)
{
    auto const op = STEP_OP_MAP.find(json.at("op").get<std::string>());
    if (op == STEP_OP_MAP.end()) {
        throw std::invalid_argument{
            "unknown op " + json.at("op").get<std::string>()};
    }

    Step step{.op = op->second};
    if (json.contains("sender")) {
        step.sender = parse_address(json["sender"]);
    }
    if (json.contains("time")) {
        step.time = json["time"].get<uint64_t>();
    }
    if (json.contains("asset")) {
        step.asset = parse_address(json["asset"]);
    }
    if (json.contains("reward_asset")) {
        step.reward_asset = parse_address(json["reward_asset"]);
    }
    if (json.contains("pool")) {
        step.pool_id = json["pool"].get<uint64_t>();
    }
    if (json.contains("amount")) {
        step.amount = parse_uint(json["amount"]);
    }
    if (json.contains("rate")) {
        step.rate = parse_uint(json["rate"]);
    }
    if (json.contains("expect_error")) {
        step.expect_error = json["expect_error"].get<std::string>();
    }
    return step;
}

std::vector<Step> parse_scenario(nlohmann::json const &json)
{
    std::vector<Step> steps;
    for (auto const &item : json.at("steps")) {
        steps.push_back(parse_step(item));
    }
    return steps;
}

ScenarioRunner::ScenarioRunner(VaultHost &host)
    : host_{host}
{
}

void ScenarioRunner::track(Step const &step)
{
    if (step.sender != Address{}) {
        insert_unique(accounts_, step.sender);
    }
    if (step.asset != Address{}) {
        insert_unique(assets_, step.asset);
    }
    if (step.reward_asset != Address{}) {
        insert_unique(assets_, step.reward_asset);
    }
}

StepResult ScenarioRunner::apply(Step const &step)
{
    track(step);
    CallContext const ctx{.sender = step.sender, .timestamp = step.time};

    switch (step.op) {
    case StepOp::InitPool: {
        auto const res =
            host_.initialize_pool(ctx, step.asset, step.reward_asset);
        if (res.has_value()) {
            insert_unique(pools_, res.value());
        }
        return to_step_result(res);
    }
    case StepOp::Mint:
        return to_step_result(host_.mint(step.asset, step.sender, step.amount));
    case StepOp::Deposit:
        return to_step_result(host_.deposit(ctx, step.pool_id, step.amount));
    case StepOp::Withdraw:
        return to_step_result(host_.withdraw(ctx, step.pool_id, step.amount));
    case StepOp::FundRewards:
        return to_step_result(
            host_.fund_rewards(ctx, step.pool_id, step.amount, step.rate));
    case StepOp::ClaimRewards:
        return to_step_result(host_.claim_rewards(ctx, step.pool_id));
    case StepOp::PendingRewards:
        return to_step_result(
            host_.pending_rewards(step.pool_id, step.sender, step.time));
    }
    throw std::invalid_argument{"unhandled op"};
}

bool ScenarioRunner::run(std::vector<Step> const &steps)
{
    bool ok = true;
    for (size_t i = 0; i < steps.size(); ++i) {
        auto const &step = steps[i];
        auto const result = apply(step);
        std::string const expected = step.expect_error.value_or("");
        if (result.error != expected) {
            LOG_ERROR(
                "step {}: expected '{}', got '{}'",
                i,
                expected,
                result.error);
            ok = false;
        }
        else if (result.error.empty()) {
            LOG_INFO("step {}: ok {}", i, result.value);
        }
        else {
            LOG_INFO("step {}: failed as expected with '{}'", i, result.error);
        }
    }
    return ok;
}

nlohmann::json ScenarioRunner::dump()
{
    nlohmann::json json;

    json["pools"] = nlohmann::json::array();
    for (auto const &pool_id : pools_) {
        auto const pool = host_.get_pool(pool_id);
        if (pool.has_error()) {
            continue;
        }
        auto const &info = pool.value();
        nlohmann::json p;
        p["id"] = pool_id.native();
        p["asset"] = to_hex(info.asset);
        p["reward_asset"] = to_hex(info.reward_asset);
        p["total_shares"] = to_dec(info.total_shares);
        p["acc_reward_per_share"] = to_dec(info.acc_reward_per_share);
        p["reward_rate"] = to_dec(info.reward_rate);
        p["last_update"] = info.last_update;
        p["stranded"] = to_dec(info.stranded);
        p["pool_balance"] = to_dec(info.pool_balance);
        p["reward_balance"] = to_dec(info.reward_balance);
        p["deposit_custody"] = to_hex(deposit_custody(pool_id));
        p["reward_custody"] = to_hex(reward_custody(pool_id));

        p["positions"] = nlohmann::json::array();
        for (auto const &owner : accounts_) {
            auto const position = host_.get_position(pool_id, owner);
            if (position.has_error()) {
                continue;
            }
            auto const &pos = position.value();
            p["positions"].push_back(
                {{"owner", to_hex(pos.owner)},
                 {"shares", to_dec(pos.shares)},
                 {"reward_debt", to_dec(pos.reward_debt)},
                 {"pending_reward", to_dec(pos.pending_reward)}});
        }
        json["pools"].push_back(p);
    }

    json["balances"] = nlohmann::json::array();
    for (auto const &asset : assets_) {
        for (auto const &account : accounts_) {
            auto const balance = host_.balance_of(asset, account);
            if (balance == 0) {
                continue;
            }
            json["balances"].push_back(
                {{"asset", to_hex(asset)},
                 {"account", to_hex(account)},
                 {"balance", to_dec(balance)}});
        }
    }

    json["events"] = host_.logs().size();
    return json;
}

VAULT_NAMESPACE_END
