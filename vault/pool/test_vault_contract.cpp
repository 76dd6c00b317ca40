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
#include <vault/core/result.hpp>
#include <vault/custody/custody_adapter.hpp>
#include <vault/custody/custody_error.hpp>
#include <vault/custody/state_custody.hpp>
#include <vault/pool/constants.hpp>
#include <vault/pool/pool.hpp>
#include <vault/pool/vault_contract.hpp>
#include <vault/pool/vault_error.hpp>
#include <vault/state/state.hpp>

#include <boost/outcome/try.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>

using namespace vault;
using namespace intx::literals;

namespace
{
    constexpr auto ASSET{0xaaaa_address};
    constexpr auto REWARD{0xbbbb_address};
    constexpr auto ALICE{0xa11ce_address};
    constexpr auto BOB{0xb0b_address};
    constexpr auto FUNDER{0xf00d_address};

    constexpr uint256_t INITIAL_BALANCE{1'000'000};

    // Credits the custody account one unit less than it was asked to.
    class SkimmingCustody final : public CustodyAdapter
    {
        StateCustody &inner_;

    public:
        explicit SkimmingCustody(StateCustody &inner)
            : inner_{inner}
        {
        }

        Result<void> transfer_in(
            Address const &asset, Address const &from, Address const &to,
            uint256_t const &amount) override
        {
            BOOST_OUTCOME_TRY(inner_.transfer_in(asset, from, to, amount));
            return inner_.transfer_out(asset, to, FEE_SINK, 1);
        }

        Result<void> transfer_out(
            Address const &asset, Address const &from, Address const &to,
            uint256_t const &amount) override
        {
            return inner_.transfer_out(asset, from, to, amount);
        }

        uint256_t
        balance_of(Address const &asset, Address const &account) const override
        {
            return inner_.balance_of(asset, account);
        }

        static constexpr auto FEE_SINK{0xfee_address};
    };
}

struct Vault : public ::testing::Test
{
    State state;
    StateCustody custody{state};
    VaultContract contract{state, custody};
    u64_be pool_id{};

    void SetUp() override
    {
        for (auto const &account : {ALICE, BOB, FUNDER}) {
            ASSERT_FALSE(
                custody.mint(ASSET, account, INITIAL_BALANCE).has_error());
            ASSERT_FALSE(
                custody.mint(REWARD, account, INITIAL_BALANCE).has_error());
        }
        auto const res = contract.initialize_pool(ASSET, REWARD, 0);
        ASSERT_FALSE(res.has_error());
        pool_id = res.value();
    }

    uint256_t shares_of(Address const &owner)
    {
        auto const res = contract.get_position(pool_id, owner);
        return res.has_error() ? uint256_t{0} : res.value().shares;
    }

    uint256_t pool_balance()
    {
        return custody.balance_of(ASSET, deposit_custody(pool_id));
    }

    uint256_t reward_balance()
    {
        return custody.balance_of(REWARD, reward_custody(pool_id));
    }
};

TEST_F(Vault, initialize_pool)
{
    EXPECT_EQ(pool_id.native(), 1);

    auto const pool = contract.get_pool(pool_id);
    ASSERT_FALSE(pool.has_error());
    EXPECT_EQ(pool.value().asset, ASSET);
    EXPECT_EQ(pool.value().reward_asset, REWARD);
    EXPECT_EQ(pool.value().total_shares, 0);
    EXPECT_EQ(pool.value().last_update, 0);

    auto const id = contract.get_pool_id(ASSET);
    ASSERT_FALSE(id.has_error());
    EXPECT_EQ(id.value().native(), 1);

    auto const second = contract.initialize_pool(0xcccc_address, REWARD, 5);
    ASSERT_FALSE(second.has_error());
    EXPECT_EQ(second.value().native(), 2);
    EXPECT_EQ(contract.get_pool(second.value()).value().last_update, 5);
}

TEST_F(Vault, initialize_pool_errors)
{
    auto const exists = contract.initialize_pool(ASSET, 0xcccc_address, 0);
    ASSERT_TRUE(exists.has_error());
    EXPECT_EQ(exists.assume_error(), VaultError::PoolExists);

    auto const zero = contract.initialize_pool(Address{}, REWARD, 0);
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.assume_error(), VaultError::InvalidAsset);

    auto const same =
        contract.initialize_pool(0xcccc_address, 0xcccc_address, 0);
    ASSERT_TRUE(same.has_error());
    EXPECT_EQ(same.assume_error(), VaultError::InvalidAsset);

    auto const unknown = contract.get_pool_id(0xcccc_address);
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.assume_error(), VaultError::UnknownPool);
}

TEST_F(Vault, first_deposit_bootstraps)
{
    auto const res = contract.deposit(pool_id, ALICE, 1000, 0);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 1000);

    EXPECT_EQ(pool_balance(), 1000);
    EXPECT_EQ(custody.balance_of(ASSET, ALICE), INITIAL_BALANCE - 1000);

    auto const position = contract.get_position(pool_id, ALICE);
    ASSERT_FALSE(position.has_error());
    EXPECT_EQ(position.value().owner, ALICE);
    EXPECT_EQ(position.value().pool_id.native(), 1);
    EXPECT_EQ(position.value().shares, 1000);
    EXPECT_EQ(contract.get_pool(pool_id).value().total_shares, 1000);
}

TEST_F(Vault, proportional_deposit)
{
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    auto const res = contract.deposit(pool_id, BOB, 500, 0);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 500);
    EXPECT_EQ(contract.get_pool(pool_id).value().total_shares, 1500);
}

TEST_F(Vault, deposit_errors)
{
    auto const zero = contract.deposit(pool_id, ALICE, 0, 0);
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.assume_error(), VaultError::InvalidAmount);

    auto const unknown = contract.deposit(7, ALICE, 10, 0);
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.assume_error(), VaultError::UnknownPool);

    auto const broke = contract.deposit(pool_id, 0xdead_address, 10, 0);
    ASSERT_TRUE(broke.has_error());
    EXPECT_EQ(broke.assume_error(), CustodyError::InsufficientBalance);
}

TEST_F(Vault, tiny_deposit_moves_nothing)
{
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    // yield arriving from outside the vault
    ASSERT_FALSE(
        custody.mint(ASSET, deposit_custody(pool_id), 999'000).has_error());

    auto const res = contract.deposit(pool_id, BOB, 1, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::InvalidAmount);
    EXPECT_EQ(custody.balance_of(ASSET, BOB), INITIAL_BALANCE);
    EXPECT_EQ(pool_balance(), 1'000'000);
    EXPECT_FALSE(contract.get_position(pool_id, BOB).has_value());
}

TEST_F(Vault, withdraw)
{
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());

    auto const res = contract.withdraw(pool_id, ALICE, 400, 1);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 400);
    EXPECT_EQ(shares_of(ALICE), 600);
    EXPECT_EQ(pool_balance(), 600);
    EXPECT_EQ(custody.balance_of(ASSET, ALICE), INITIAL_BALANCE - 600);
}

TEST_F(Vault, withdraw_errors)
{
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());

    auto const zero = contract.withdraw(pool_id, ALICE, 0, 0);
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.assume_error(), VaultError::InvalidAmount);

    auto const excess = contract.withdraw(pool_id, ALICE, 1001, 0);
    ASSERT_TRUE(excess.has_error());
    EXPECT_EQ(excess.assume_error(), VaultError::InsufficientShares);

    auto const stranger = contract.withdraw(pool_id, BOB, 1, 0);
    ASSERT_TRUE(stranger.has_error());
    EXPECT_EQ(stranger.assume_error(), VaultError::UnknownPosition);

    EXPECT_EQ(shares_of(ALICE), 1000);
}

TEST_F(Vault, full_withdraw_closes_position)
{
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    auto const res = contract.withdraw(pool_id, ALICE, 1000, 10);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 1000);

    auto const position = contract.get_position(pool_id, ALICE);
    ASSERT_TRUE(position.has_error());
    EXPECT_EQ(position.assume_error(), VaultError::UnknownPosition);
    EXPECT_EQ(contract.get_pool(pool_id).value().total_shares, 0);
    EXPECT_EQ(custody.balance_of(ASSET, ALICE), INITIAL_BALANCE);
}

TEST_F(Vault, claim_rewards)
{
    ASSERT_FALSE(
        contract.fund_rewards(pool_id, FUNDER, 1000, 10, 0).has_error());
    EXPECT_EQ(reward_balance(), 1000);
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());

    // 10s at 10/s over 1000 shares
    auto const pending = contract.pending_rewards(pool_id, ALICE, 10);
    ASSERT_FALSE(pending.has_error());
    EXPECT_EQ(pending.value(), 100);

    auto const res = contract.claim_rewards(pool_id, ALICE, 10);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 100);
    EXPECT_EQ(reward_balance(), 900);
    EXPECT_EQ(custody.balance_of(REWARD, ALICE), INITIAL_BALANCE + 100);

    auto const again = contract.claim_rewards(pool_id, ALICE, 10);
    ASSERT_FALSE(again.has_error());
    EXPECT_EQ(again.value(), 0);
}

TEST_F(Vault, rewards_split_by_shares_over_time)
{
    ASSERT_FALSE(
        contract.fund_rewards(pool_id, FUNDER, 10'000, 10, 0).has_error());
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    ASSERT_FALSE(contract.deposit(pool_id, BOB, 1000, 10).has_error());

    auto const alice = contract.claim_rewards(pool_id, ALICE, 20);
    ASSERT_FALSE(alice.has_error());
    EXPECT_EQ(alice.value(), 150);

    auto const bob = contract.claim_rewards(pool_id, BOB, 20);
    ASSERT_FALSE(bob.has_error());
    EXPECT_EQ(bob.value(), 50);
}

TEST_F(Vault, rate_change_is_not_retroactive)
{
    ASSERT_FALSE(
        contract.fund_rewards(pool_id, FUNDER, 1000, 10, 0).has_error());
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    ASSERT_FALSE(
        contract.fund_rewards(pool_id, FUNDER, 1, 0, 10).has_error());

    auto const res = contract.claim_rewards(pool_id, ALICE, 20);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 100);
    EXPECT_EQ(contract.get_pool(pool_id).value().reward_rate, 0);
}

TEST_F(Vault, fund_rewards_errors)
{
    auto const zero = contract.fund_rewards(pool_id, FUNDER, 0, 10, 0);
    ASSERT_TRUE(zero.has_error());
    EXPECT_EQ(zero.assume_error(), VaultError::InvalidAmount);

    auto const unknown = contract.fund_rewards(9, FUNDER, 1, 10, 0);
    ASSERT_TRUE(unknown.has_error());
    EXPECT_EQ(unknown.assume_error(), VaultError::UnknownPool);
}

TEST_F(Vault, zero_rate_claim_pays_nothing)
{
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    auto const res = contract.claim_rewards(pool_id, ALICE, 1000);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 0);
    EXPECT_EQ(shares_of(ALICE), 1000);
}

TEST_F(Vault, pending_reward_defers_close)
{
    ASSERT_FALSE(
        contract.fund_rewards(pool_id, FUNDER, 1000, 10, 0).has_error());
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    ASSERT_FALSE(contract.withdraw(pool_id, ALICE, 1000, 10).has_error());

    auto const position = contract.get_position(pool_id, ALICE);
    ASSERT_FALSE(position.has_error());
    EXPECT_EQ(position.value().shares, 0);
    EXPECT_EQ(position.value().pending_reward, 100);

    auto const res = contract.claim_rewards(pool_id, ALICE, 10);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value(), 100);
    EXPECT_FALSE(contract.get_position(pool_id, ALICE).has_value());
}

TEST_F(Vault, insufficient_reward_balance)
{
    ASSERT_FALSE(contract.fund_rewards(pool_id, FUNDER, 50, 10, 0).has_error());
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());

    auto const res = contract.claim_rewards(pool_id, ALICE, 10);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::InsufficientRewardBalance);
    EXPECT_EQ(reward_balance(), 50);
    EXPECT_EQ(custody.balance_of(REWARD, ALICE), INITIAL_BALANCE);
}

TEST_F(Vault, clock_rewind)
{
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 10).has_error());
    auto const res = contract.deposit(pool_id, ALICE, 1000, 5);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::ClockRewind);
}

TEST_F(Vault, bootstrap_residual_is_never_allocated)
{
    // donation before anyone deposited
    ASSERT_FALSE(
        custody.mint(ASSET, deposit_custody(pool_id), 7).has_error());

    auto const shares = contract.deposit(pool_id, ALICE, 100, 0);
    ASSERT_FALSE(shares.has_error());
    EXPECT_EQ(shares.value(), 100);
    EXPECT_EQ(contract.get_pool(pool_id).value().stranded, 7);

    auto const preview = contract.preview_withdraw(pool_id, 100);
    ASSERT_FALSE(preview.has_error());
    EXPECT_EQ(preview.value(), 100);

    auto const amount = contract.withdraw(pool_id, ALICE, 100, 0);
    ASSERT_FALSE(amount.has_error());
    EXPECT_EQ(amount.value(), 100);
    EXPECT_EQ(pool_balance(), 7);
}

TEST_F(Vault, preview_deposit)
{
    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    auto const preview = contract.preview_deposit(pool_id, 500);
    ASSERT_FALSE(preview.has_error());
    EXPECT_EQ(preview.value(), 500);
    EXPECT_EQ(contract.get_pool(pool_id).value().total_shares, 1000);
}

TEST_F(Vault, events)
{
    ASSERT_EQ(state.logs().size(), 1);
    EXPECT_EQ(state.logs()[0].topics[0], EventId::POOL_INITIALIZED);

    ASSERT_FALSE(contract.deposit(pool_id, ALICE, 1000, 0).has_error());
    ASSERT_EQ(state.logs().size(), 2);

    auto const &log = state.logs()[1];
    EXPECT_EQ(log.address, VAULT_CA);
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(log.topics[0], EventId::DEPOSIT);
    EXPECT_EQ(log.topics[1], intx::be::store<bytes32_t>(uint256_t{1}));
    ASSERT_EQ(log.data.size(), 64);
    EXPECT_EQ(
        intx::be::unsafe::load<uint256_t>(log.data.data()), uint256_t{1000});
    EXPECT_EQ(
        intx::be::unsafe::load<uint256_t>(log.data.data() + 32),
        uint256_t{1000});
}

struct SkimmedVault : public ::testing::Test
{
    State state;
    StateCustody inner{state};
    SkimmingCustody custody{inner};
    VaultContract contract{state, custody};
    u64_be pool_id{};

    void SetUp() override
    {
        ASSERT_FALSE(inner.mint(ASSET, ALICE, INITIAL_BALANCE).has_error());
        ASSERT_FALSE(inner.mint(REWARD, FUNDER, INITIAL_BALANCE).has_error());
        auto const res = contract.initialize_pool(ASSET, REWARD, 0);
        ASSERT_FALSE(res.has_error());
        pool_id = res.value();
    }
};

TEST_F(SkimmedVault, deposit_transfer_shortfall)
{
    auto const res = contract.deposit(pool_id, ALICE, 1000, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::TransferShortfall);
}

TEST_F(SkimmedVault, fund_transfer_shortfall)
{
    auto const res = contract.fund_rewards(pool_id, FUNDER, 1000, 10, 0);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultError::TransferShortfall);
}
