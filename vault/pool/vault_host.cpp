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

#include <vault/pool/vault_host.hpp>

#include <quill/Quill.h>

#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

VAULT_NAMESPACE_BEGIN

VaultHost::VaultHost()
    : custody_{state_}
    , contract_{state_, custody_}
{
}

template <typename Op>
auto VaultHost::execute(std::string_view const name, Op &&op)
{
    state_.push();
    auto res = std::forward<Op>(op)();
    if (res.has_error()) {
        state_.pop_reject();
        LOG_DEBUG(
            "VaultHost: {} rejected: {}",
            name,
            std::string{res.error().message().c_str()});
    }
    else {
        state_.pop_accept();
    }
    return res;
}

Result<u64_be> VaultHost::initialize_pool(
    CallContext const &ctx, Address const &asset, Address const &reward_asset)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return execute("initialize_pool", [&] {
        return contract_.initialize_pool(asset, reward_asset, ctx.timestamp);
    });
}

Result<uint256_t> VaultHost::deposit(
    CallContext const &ctx, u64_be const pool_id, uint256_t const &amount)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return execute("deposit", [&] {
        return contract_.deposit(pool_id, ctx.sender, amount, ctx.timestamp);
    });
}

Result<uint256_t> VaultHost::withdraw(
    CallContext const &ctx, u64_be const pool_id, uint256_t const &shares)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return execute("withdraw", [&] {
        return contract_.withdraw(pool_id, ctx.sender, shares, ctx.timestamp);
    });
}

Result<void> VaultHost::fund_rewards(
    CallContext const &ctx, u64_be const pool_id, uint256_t const &amount,
    uint256_t const &rate)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return execute("fund_rewards", [&] {
        return contract_.fund_rewards(
            pool_id, ctx.sender, amount, rate, ctx.timestamp);
    });
}

Result<uint256_t>
VaultHost::claim_rewards(CallContext const &ctx, u64_be const pool_id)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return execute("claim_rewards", [&] {
        return contract_.claim_rewards(pool_id, ctx.sender, ctx.timestamp);
    });
}

Result<void> VaultHost::mint(
    Address const &asset, Address const &to, uint256_t const &amount)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return execute("mint", [&] { return custody_.mint(asset, to, amount); });
}

Result<VaultContract::PoolInfo> VaultHost::get_pool(u64_be const pool_id)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return contract_.get_pool(pool_id);
}

Result<u64_be> VaultHost::get_pool_id(Address const &asset)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return contract_.get_pool_id(asset);
}

Result<VaultContract::PositionInfo>
VaultHost::get_position(u64_be const pool_id, Address const &owner)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return contract_.get_position(pool_id, owner);
}

Result<uint256_t>
VaultHost::preview_deposit(u64_be const pool_id, uint256_t const &amount)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return contract_.preview_deposit(pool_id, amount);
}

Result<uint256_t>
VaultHost::preview_withdraw(u64_be const pool_id, uint256_t const &shares)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return contract_.preview_withdraw(pool_id, shares);
}

Result<uint256_t> VaultHost::pending_rewards(
    u64_be const pool_id, Address const &owner, uint64_t const now)
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return contract_.pending_rewards(pool_id, owner, now);
}

uint256_t
VaultHost::balance_of(Address const &asset, Address const &account) const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return custody_.balance_of(asset, account);
}

std::vector<Log> VaultHost::logs() const
{
    std::lock_guard<std::mutex> const lock{mutex_};
    return state_.logs();
}

VAULT_NAMESPACE_END
