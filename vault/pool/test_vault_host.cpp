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

#include <vault/core/address.hpp>
#include <vault/core/big_endian.hpp>
#include <vault/core/int.hpp>
#include <vault/pool/pool.hpp>
#include <vault/pool/vault_error.hpp>
#include <vault/pool/vault_host.hpp>

#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <array>
#include <cstdint>
#include <random>
#include <thread>
#include <vector>

using namespace vault;
using namespace intx::literals;

namespace
{
    constexpr auto ASSET{0xaaaa_address};
    constexpr auto REWARD{0xbbbb_address};
    constexpr auto ALICE{0xa11ce_address};
    constexpr auto BOB{0xb0b_address};
    constexpr auto CAROL{0xca201_address};
    constexpr auto FUNDER{0xf00d_address};

    constexpr uint256_t INITIAL_BALANCE{1'000'000'000};
}

struct Host : public ::testing::Test
{
    VaultHost host;
    u64_be pool_id{};

    void SetUp() override
    {
        for (auto const &account : {ALICE, BOB, CAROL, FUNDER}) {
            ASSERT_FALSE(host.mint(ASSET, account, INITIAL_BALANCE).has_error());
            ASSERT_FALSE(
                host.mint(REWARD, account, INITIAL_BALANCE).has_error());
        }
        auto const res = host.initialize_pool({.sender = FUNDER}, ASSET, REWARD);
        ASSERT_FALSE(res.has_error());
        pool_id = res.value();
    }

    uint256_t shares_of(Address const &owner)
    {
        auto const res = host.get_position(pool_id, owner);
        return res.has_error() ? uint256_t{0} : res.value().shares;
    }
};

TEST_F(Host, failed_operation_leaves_no_trace)
{
    ASSERT_FALSE(host.fund_rewards(
                         {.sender = FUNDER, .timestamp = 0}, pool_id, 1000, 10)
                     .has_error());
    ASSERT_FALSE(
        host.deposit({.sender = ALICE, .timestamp = 0}, pool_id, 1000)
            .has_error());
    auto const logs_before = host.logs().size();

    // settles first, then fails on the share check
    auto const res =
        host.withdraw({.sender = ALICE, .timestamp = 10}, pool_id, 2000);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::InsufficientShares);

    auto const pool = host.get_pool(pool_id);
    ASSERT_FALSE(pool.has_error());
    EXPECT_EQ(pool.value().last_update, 0);
    EXPECT_EQ(pool.value().acc_reward_per_share, 0);

    auto const position = host.get_position(pool_id, ALICE);
    ASSERT_FALSE(position.has_error());
    EXPECT_EQ(position.value().pending_reward, 0);
    EXPECT_EQ(position.value().shares, 1000);
    EXPECT_EQ(host.logs().size(), logs_before);
}

TEST_F(Host, failed_claim_pays_nothing)
{
    ASSERT_FALSE(
        host.fund_rewards({.sender = FUNDER, .timestamp = 0}, pool_id, 50, 10)
            .has_error());
    ASSERT_FALSE(
        host.deposit({.sender = ALICE, .timestamp = 0}, pool_id, 1000)
            .has_error());

    auto const res = host.claim_rewards({.sender = ALICE, .timestamp = 10}, pool_id);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::InsufficientRewardBalance);

    EXPECT_EQ(host.balance_of(REWARD, ALICE), INITIAL_BALANCE);
    EXPECT_EQ(host.balance_of(REWARD, reward_custody(pool_id)), 50);
    EXPECT_EQ(host.get_position(pool_id, ALICE).value().pending_reward, 0);

    auto const pending = host.pending_rewards(pool_id, ALICE, 10);
    ASSERT_FALSE(pending.has_error());
    EXPECT_EQ(pending.value(), 100);
}

TEST_F(Host, failed_first_deposit_opens_no_position)
{
    auto const res =
        host.deposit({.sender = 0xdead_address, .timestamp = 3}, pool_id, 10);
    ASSERT_TRUE(res.has_error());
    EXPECT_FALSE(host.get_position(pool_id, 0xdead_address).has_value());
    EXPECT_EQ(host.get_pool(pool_id).value().last_update, 0);
}

TEST_F(Host, conservation)
{
    std::array<Address, 3> const owners{ALICE, BOB, CAROL};
    std::mt19937_64 rng{42};

    ASSERT_FALSE(host.fund_rewards(
                         {.sender = FUNDER, .timestamp = 0},
                         pool_id,
                         100'000'000,
                         1'000)
                     .has_error());

    uint256_t deposited = 0;
    uint256_t withdrawn = 0;
    uint256_t claimed = 0;
    uint64_t now = 0;

    for (size_t i = 0; i < 500; ++i) {
        now += rng() % 5;
        Address const owner = owners[rng() % owners.size()];
        CallContext const ctx{.sender = owner, .timestamp = now};

        switch (rng() % 3) {
        case 0: {
            uint256_t const amount{1 + rng() % 100'000};
            auto const res = host.deposit(ctx, pool_id, amount);
            if (res.has_value()) {
                EXPECT_GT(res.value(), 0);
                deposited += amount;
            }
            break;
        }
        case 1: {
            uint256_t const held = shares_of(owner);
            if (held == 0) {
                break;
            }
            uint256_t const shares = uint256_t{1} + uint256_t{rng()} % held;
            auto const res = host.withdraw(ctx, pool_id, shares);
            ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
            withdrawn += res.value();
            break;
        }
        default: {
            auto const res = host.claim_rewards(ctx, pool_id);
            if (res.has_value()) {
                claimed += res.value();
            }
            break;
        }
        }

        uint256_t sum = 0;
        for (auto const &o : owners) {
            sum += shares_of(o);
        }
        auto const pool = host.get_pool(pool_id);
        ASSERT_FALSE(pool.has_error());
        ASSERT_EQ(pool.value().total_shares, sum);
        ASSERT_LE(withdrawn, deposited);
        ASSERT_EQ(pool.value().pool_balance, deposited - withdrawn);
        ASSERT_LE(claimed, 100'000'000);
    }

    // everyone leaves
    now += 1;
    for (auto const &owner : owners) {
        CallContext const ctx{.sender = owner, .timestamp = now};
        uint256_t const held = shares_of(owner);
        if (held != 0) {
            auto const res = host.withdraw(ctx, pool_id, held);
            ASSERT_FALSE(res.has_error());
            withdrawn += res.value();
        }
    }
    EXPECT_EQ(host.get_pool(pool_id).value().total_shares, 0);
    EXPECT_LE(withdrawn, deposited);
}

TEST_F(Host, concurrent_deposits_serialize)
{
    std::vector<std::thread> threads;
    for (auto const &owner : {ALICE, BOB, CAROL}) {
        threads.emplace_back([this, owner] {
            for (int i = 0; i < 100; ++i) {
                auto const res = host.deposit(
                    {.sender = owner, .timestamp = 0}, pool_id, 10);
                EXPECT_FALSE(res.has_error());
            }
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(host.get_pool(pool_id).value().total_shares, 3000);
    EXPECT_EQ(shares_of(ALICE), 1000);
    EXPECT_EQ(host.balance_of(ASSET, deposit_custody(pool_id)), 3000);
}

TEST_F(Host, deposit_from_own_custody_account_is_rejected)
{
    // a transfer from the custody account to itself credits nothing
    Address const custody = deposit_custody(pool_id);
    ASSERT_FALSE(host.mint(ASSET, custody, 100).has_error());

    auto const res =
        host.deposit({.sender = custody, .timestamp = 0}, pool_id, 100);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::TransferShortfall);

    auto const pool = host.get_pool(pool_id);
    ASSERT_FALSE(pool.has_error());
    EXPECT_EQ(pool.value().total_shares, 0);
    EXPECT_EQ(
        host.get_position(pool_id, custody).assume_error(),
        VaultError::UnknownPosition);
    EXPECT_EQ(host.balance_of(ASSET, custody), 100);
}
