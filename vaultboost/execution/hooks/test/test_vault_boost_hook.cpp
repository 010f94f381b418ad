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

#include <vaultboost/core/bytes.hpp>
#include <vaultboost/core/int.hpp>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/contract/abi_encode.hpp>
#include <vaultboost/execution/core/contract/abi_signatures.hpp>
#include <vaultboost/execution/core/receipt.hpp>
#include <vaultboost/execution/hooks/prize_pool_client.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_error.hpp>
#include <vaultboost/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <tuple>
#include <vector>

using namespace vaultboost;

namespace
{
    constexpr auto HOOK_CA{0x0000000000000000000000000000000000001000_address};
    constexpr auto PRIZE_POOL{
        0x9999999999999999999999999999999999999999_address};
    constexpr auto booster_a{
        0xaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa_address};
    constexpr auto booster_b{
        0xbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb_address};
    constexpr auto vault_v{0x5656565656565656565656565656565656565656_address};

    constexpr auto set_vault_beneficiary_signature =
        abi_encode_event_signature("SetVaultBeneficiary(address,address)");
    constexpr auto boosted_prize_vault_signature = abi_encode_event_signature(
        "BoostedPrizeVault(address,address,address,uint256)");

    // Records the calls the hook makes and answers with canned values
    class FakePrizePool final : public PrizePoolClient
    {
    public:
        uint8_t tiers{10};
        bool fail_contribute{false};
        unsigned number_of_tiers_calls{0};
        std::vector<std::tuple<Address, Address, uint256_t>> contributions;

        Result<uint8_t> number_of_tiers(Address const &) override
        {
            ++number_of_tiers_calls;
            return tiers;
        }

        Result<void> contribute_prize_tokens(
            Address const &prize_pool, Address const &beneficiary,
            uint256_t const &amount) override
        {
            if (fail_contribute) {
                return VaultBoostHookError::PrizePoolCallFailed;
            }
            contributions.emplace_back(prize_pool, beneficiary, amount);
            return outcome::success();
        }
    };
}

struct VaultBoostHookTest : public ::testing::Test
{
    State state;
    FakePrizePool prize_pool;
    VaultBoostHook hook{state, HOOK_CA, prize_pool};

    void SetUp() override
    {
        ASSERT_FALSE(
            VaultBoostHook::deploy(state, HOOK_CA, PRIZE_POOL).has_error());
    }
};

TEST(VaultBoostHookDeploy, zero_prize_pool)
{
    State state;
    auto const res = VaultBoostHook::deploy(state, HOOK_CA, Address{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultBoostHookError::PrizePoolAddressZero);
    EXPECT_TRUE(state.get_storage_slots(HOOK_CA).empty());
}

TEST(VaultBoostHookDeploy, not_deployed)
{
    State state;
    FakePrizePool prize_pool;
    VaultBoostHook hook{state, HOOK_CA, prize_pool};

    auto const pool = hook.prize_pool();
    ASSERT_TRUE(pool.has_error());
    EXPECT_EQ(pool.assume_error(), VaultBoostHookError::NotDeployed);

    auto const recipient = hook.before_claim_prize(booster_a, 9);
    ASSERT_TRUE(recipient.has_error());
    EXPECT_EQ(recipient.assume_error(), VaultBoostHookError::NotDeployed);
}

TEST_F(VaultBoostHookTest, prize_pool_retained)
{
    auto const pool = hook.prize_pool();
    ASSERT_TRUE(pool.has_value());
    EXPECT_EQ(pool.value(), PRIZE_POOL);

    auto const redeploy = VaultBoostHook::deploy(
        state, HOOK_CA, 0x0000000000000000000000000000000000000001_address);
    ASSERT_TRUE(redeploy.has_error());
    EXPECT_EQ(redeploy.assume_error(), VaultBoostHookError::AlreadyDeployed);
    EXPECT_EQ(hook.prize_pool().value(), PRIZE_POOL);
}

TEST_F(VaultBoostHookTest, set_beneficiary)
{
    EXPECT_EQ(hook.vault_beneficiary(booster_a), Address{});

    for (auto const &vault : {vault_v, Address{}, booster_a, PRIZE_POOL}) {
        auto const num_logs = state.logs().size();
        hook.set_beneficiary(booster_a, vault);
        EXPECT_EQ(hook.vault_beneficiary(booster_a), vault);

        ASSERT_EQ(state.logs().size(), num_logs + 1);
        auto const expected = Receipt::Log{
            .data = {},
            .topics =
                {set_vault_beneficiary_signature,
                 abi_encode_address(booster_a),
                 abi_encode_address(vault)},
            .address = HOOK_CA};
        EXPECT_EQ(state.logs().back(), expected);
    }
}

TEST_F(VaultBoostHookTest, set_beneficiary_is_per_booster)
{
    hook.set_beneficiary(booster_a, vault_v);
    EXPECT_EQ(hook.vault_beneficiary(booster_a), vault_v);
    EXPECT_EQ(hook.vault_beneficiary(booster_b), Address{});

    hook.set_beneficiary(booster_b, booster_b);
    EXPECT_EQ(hook.vault_beneficiary(booster_a), vault_v);
    EXPECT_EQ(hook.vault_beneficiary(booster_b), booster_b);

    // prize pool slot is untouched
    EXPECT_EQ(hook.prize_pool().value(), PRIZE_POOL);
}

TEST_F(VaultBoostHookTest, set_beneficiary_idempotent)
{
    hook.set_beneficiary(booster_a, vault_v);
    auto const slots = state.get_storage_slots(HOOK_CA);
    hook.set_beneficiary(booster_a, vault_v);
    EXPECT_EQ(state.get_storage_slots(HOOK_CA), slots);
    EXPECT_EQ(state.logs().size(), 2);
}

TEST_F(VaultBoostHookTest, before_claim_without_beneficiary)
{
    for (uint8_t tier = 0; tier < 12; ++tier) {
        auto const recipient = hook.before_claim_prize(booster_a, tier);
        ASSERT_TRUE(recipient.has_value());
        EXPECT_EQ(recipient.value(), booster_a);
    }
    auto const recipient = hook.before_claim_prize(booster_a, 255);
    ASSERT_TRUE(recipient.has_value());
    EXPECT_EQ(recipient.value(), booster_a);

    // the pool is not consulted when boosting is disabled
    EXPECT_EQ(prize_pool.number_of_tiers_calls, 0);
}

TEST_F(VaultBoostHookTest, before_claim_daily_tier_boundary)
{
    hook.set_beneficiary(booster_a, vault_v);
    prize_pool.tiers = 10;

    for (uint8_t tier = 0; tier < 7; ++tier) {
        auto const recipient = hook.before_claim_prize(booster_a, tier);
        ASSERT_TRUE(recipient.has_value());
        EXPECT_EQ(recipient.value(), booster_a) << unsigned{tier};
    }
    for (uint8_t tier = 7; tier < 10; ++tier) {
        auto const recipient = hook.before_claim_prize(booster_a, tier);
        ASSERT_TRUE(recipient.has_value());
        EXPECT_EQ(recipient.value(), PRIZE_POOL) << unsigned{tier};
    }
    EXPECT_EQ(prize_pool.number_of_tiers_calls, 10);
}

TEST_F(VaultBoostHookTest, before_claim_rereads_tiers)
{
    hook.set_beneficiary(booster_a, vault_v);

    prize_pool.tiers = 10;
    EXPECT_EQ(hook.before_claim_prize(booster_a, 6).value(), booster_a);

    prize_pool.tiers = 9;
    EXPECT_EQ(hook.before_claim_prize(booster_a, 6).value(), PRIZE_POOL);
}

TEST_F(VaultBoostHookTest, before_claim_smallest_tier_configuration)
{
    hook.set_beneficiary(booster_a, vault_v);

    prize_pool.tiers = 3;
    EXPECT_EQ(hook.before_claim_prize(booster_a, 0).value(), PRIZE_POOL);

    for (uint8_t const tiers : {0, 1, 2}) {
        prize_pool.tiers = tiers;
        auto const recipient = hook.before_claim_prize(booster_a, 0);
        ASSERT_TRUE(recipient.has_error());
        EXPECT_EQ(
            recipient.assume_error(),
            VaultBoostHookError::InvalidTierConfiguration);
    }
}

TEST_F(VaultBoostHookTest, before_claim_does_not_write)
{
    hook.set_beneficiary(booster_a, vault_v);
    auto const slots = state.get_storage_slots(HOOK_CA);
    auto const num_logs = state.logs().size();

    EXPECT_TRUE(hook.before_claim_prize(booster_a, 9).has_value());
    EXPECT_TRUE(hook.before_claim_prize(booster_b, 9).has_value());

    EXPECT_EQ(state.get_storage_slots(HOOK_CA), slots);
    EXPECT_EQ(state.logs().size(), num_logs);
    EXPECT_TRUE(prize_pool.contributions.empty());
}

TEST_F(VaultBoostHookTest, after_claim_contributes)
{
    hook.set_beneficiary(booster_a, vault_v);
    auto const num_logs = state.logs().size();

    auto const res = hook.after_claim_prize(booster_a, 500, PRIZE_POOL);
    ASSERT_FALSE(res.has_error());

    ASSERT_EQ(prize_pool.contributions.size(), 1);
    EXPECT_EQ(
        prize_pool.contributions[0],
        std::make_tuple(PRIZE_POOL, vault_v, uint256_t{500}));

    ASSERT_EQ(state.logs().size(), num_logs + 1);
    auto const expected = Receipt::Log{
        .data = byte_string{abi_encode_uint(uint256_t{500})},
        .topics =
            {boosted_prize_vault_signature,
             abi_encode_address(PRIZE_POOL),
             abi_encode_address(vault_v),
             abi_encode_address(booster_a)},
        .address = HOOK_CA};
    EXPECT_EQ(state.logs().back(), expected);
}

TEST_F(VaultBoostHookTest, after_claim_noop)
{
    hook.set_beneficiary(booster_a, vault_v);
    auto const num_logs = state.logs().size();

    // recipient is not the pool
    EXPECT_FALSE(hook.after_claim_prize(booster_a, 500, booster_a).has_error());
    EXPECT_FALSE(hook.after_claim_prize(booster_a, 500, vault_v).has_error());
    // nothing was won
    EXPECT_FALSE(hook.after_claim_prize(booster_a, 0, PRIZE_POOL).has_error());
    EXPECT_FALSE(hook.after_claim_prize(booster_a, 0, booster_a).has_error());

    EXPECT_TRUE(prize_pool.contributions.empty());
    EXPECT_EQ(state.logs().size(), num_logs);
}

TEST_F(VaultBoostHookTest, after_claim_reads_current_beneficiary)
{
    hook.set_beneficiary(booster_a, vault_v);
    EXPECT_EQ(hook.before_claim_prize(booster_a, 9).value(), PRIZE_POOL);

    hook.set_beneficiary(booster_a, booster_b);
    ASSERT_FALSE(hook.after_claim_prize(booster_a, 42, PRIZE_POOL).has_error());
    ASSERT_EQ(prize_pool.contributions.size(), 1);
    EXPECT_EQ(std::get<1>(prize_pool.contributions[0]), booster_b);

    // cleared between the hooks: the contribution still goes out, to zero
    hook.set_beneficiary(booster_a, Address{});
    ASSERT_FALSE(hook.after_claim_prize(booster_a, 42, PRIZE_POOL).has_error());
    ASSERT_EQ(prize_pool.contributions.size(), 2);
    EXPECT_EQ(std::get<1>(prize_pool.contributions[1]), Address{});
}

TEST_F(VaultBoostHookTest, after_claim_contribution_fails)
{
    hook.set_beneficiary(booster_a, vault_v);
    auto const num_logs = state.logs().size();
    prize_pool.fail_contribute = true;

    auto const res = hook.after_claim_prize(booster_a, 500, PRIZE_POOL);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultBoostHookError::PrizePoolCallFailed);
    EXPECT_EQ(state.logs().size(), num_logs);
}

TEST_F(VaultBoostHookTest, scenario_boost_daily_prize)
{
    prize_pool.tiers = 10;

    // no beneficiary: never redirected
    EXPECT_EQ(hook.before_claim_prize(booster_a, 9).value(), booster_a);

    hook.set_beneficiary(booster_a, vault_v);
    EXPECT_EQ(hook.before_claim_prize(booster_a, 6).value(), booster_a);

    auto const recipient = hook.before_claim_prize(booster_a, 7);
    ASSERT_TRUE(recipient.has_value());
    ASSERT_EQ(recipient.value(), PRIZE_POOL);

    ASSERT_FALSE(
        hook.after_claim_prize(booster_a, 500, recipient.value()).has_error());
    ASSERT_EQ(prize_pool.contributions.size(), 1);
    EXPECT_EQ(
        prize_pool.contributions[0],
        std::make_tuple(PRIZE_POOL, vault_v, uint256_t{500}));

    auto const &logs = state.logs();
    ASSERT_EQ(logs.size(), 2);
    EXPECT_EQ(logs[1].topics[0], boosted_prize_vault_signature);
    EXPECT_EQ(logs[1].topics[2], abi_encode_address(vault_v));
    EXPECT_EQ(logs[1].topics[3], abi_encode_address(booster_a));
}
