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
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_config.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_error.hpp>
#include <vaultboost/execution/state/state.hpp>

#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace vaultboost;

namespace
{
    constexpr auto HOOK_CA{0x00000000000000000000000000000000000b0057_address};
    constexpr auto PRIZE_POOL{
        0x7f3c6b8e1d2a4c5b9e0f1a2b3c4d5e6f70819203_address};

    nlohmann::json make_genesis()
    {
        return nlohmann::json::parse(R"({
            "alloc": {
                "0000000000000000000000000000000000000001": {
                    "wei_balance": "1000"
                }
            },
            "vaultBoostHook": {
                "address": "0x00000000000000000000000000000000000b0057",
                "prizePool": "0x7f3c6b8e1d2a4c5b9e0f1a2b3c4d5e6f70819203"
            }
        })");
    }
}

TEST(VaultBoostHookConfig, read)
{
    auto const config = read_vault_boost_hook_config(make_genesis());
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().address, HOOK_CA);
    EXPECT_EQ(config.value().prize_pool, PRIZE_POOL);
}

TEST(VaultBoostHookConfig, read_missing_entry)
{
    auto genesis = make_genesis();
    genesis.erase("vaultBoostHook");

    auto const config = read_vault_boost_hook_config(genesis);
    ASSERT_TRUE(config.has_error());
    EXPECT_EQ(config.assume_error(), VaultBoostHookError::InvalidConfig);
}

TEST(VaultBoostHookConfig, read_invalid_address)
{
    for (auto const &bad :
         {nlohmann::json("0x1234"),
          nlohmann::json("0xzz3c6b8e1d2a4c5b9e0f1a2b3c4d5e6f70819203"),
          nlohmann::json(12345),
          nlohmann::json(nullptr)}) {
        auto genesis = make_genesis();
        genesis["vaultBoostHook"]["prizePool"] = bad;

        auto const config = read_vault_boost_hook_config(genesis);
        ASSERT_TRUE(config.has_error()) << bad.dump();
        EXPECT_EQ(config.assume_error(), VaultBoostHookError::InvalidConfig);
    }

    auto genesis = make_genesis();
    genesis["vaultBoostHook"].erase("address");
    EXPECT_TRUE(read_vault_boost_hook_config(genesis).has_error());
}

TEST(VaultBoostHookConfig, write_genesis)
{
    auto genesis = make_genesis();
    auto const config = read_vault_boost_hook_config(genesis);
    ASSERT_TRUE(config.has_value());
    ASSERT_FALSE(
        write_vault_boost_hook_genesis(genesis, config.value()).has_error());

    auto const &account =
        genesis["alloc"]["00000000000000000000000000000000000b0057"];
    EXPECT_EQ(account["wei_balance"], "0");
    ASSERT_EQ(account["storage"].size(), 1);

    // the prize pool slot, address in the leading bytes of the word
    EXPECT_EQ(
        account["storage"]
               ["0x0000000000000000000000000000000000000000000000000000000000000001"],
        "0x7f3c6b8e1d2a4c5b9e0f1a2b3c4d5e6f70819203000000000000000000000000");

    // other accounts are untouched
    EXPECT_EQ(
        genesis["alloc"]["0000000000000000000000000000000000000001"]
               ["wei_balance"],
        "1000");
}

TEST(VaultBoostHookConfig, write_genesis_matches_deploy)
{
    auto genesis = make_genesis();
    VaultBoostHookConfig const config{
        .address = HOOK_CA, .prize_pool = PRIZE_POOL};
    ASSERT_FALSE(write_vault_boost_hook_genesis(genesis, config).has_error());

    State state;
    ASSERT_FALSE(
        VaultBoostHook::deploy(state, HOOK_CA, PRIZE_POOL).has_error());
    auto const &storage =
        genesis["alloc"][evmc::hex(HOOK_CA)]["storage"];
    for (auto const &[key, value] : state.get_storage_slots(HOOK_CA)) {
        EXPECT_EQ(storage["0x" + evmc::hex(key)], "0x" + evmc::hex(value));
    }
}

TEST(VaultBoostHookConfig, write_genesis_zero_prize_pool)
{
    auto genesis = make_genesis();
    VaultBoostHookConfig const config{.address = HOOK_CA, .prize_pool = {}};

    auto const res = write_vault_boost_hook_genesis(genesis, config);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultBoostHookError::PrizePoolAddressZero);
    EXPECT_FALSE(genesis["alloc"].contains(evmc::hex(HOOK_CA)));
}

TEST(VaultBoostHookConfig, write_genesis_twice)
{
    auto genesis = make_genesis();
    VaultBoostHookConfig const config{
        .address = HOOK_CA, .prize_pool = PRIZE_POOL};
    ASSERT_FALSE(write_vault_boost_hook_genesis(genesis, config).has_error());

    // redeploying over the written storage with another pool is refused
    VaultBoostHookConfig const other{
        .address = HOOK_CA,
        .prize_pool = 0x00000000000000000000000000000000000000aa_address};
    auto const res = write_vault_boost_hook_genesis(genesis, other);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultBoostHookError::AlreadyDeployed);

    auto const &storage = genesis["alloc"][evmc::hex(HOOK_CA)]["storage"];
    ASSERT_EQ(storage.size(), 1);
    EXPECT_EQ(
        storage
            ["0x0000000000000000000000000000000000000000000000000000000000000001"],
        "0x7f3c6b8e1d2a4c5b9e0f1a2b3c4d5e6f70819203000000000000000000000000");
}

TEST(VaultBoostHookConfig, write_genesis_keeps_existing_storage)
{
    auto genesis = make_genesis();
    genesis["alloc"][evmc::hex(HOOK_CA)] = {
        {"wei_balance", "7"}, {"storage", {{"0x05", "0x2a"}}}};

    VaultBoostHookConfig const config{
        .address = HOOK_CA, .prize_pool = PRIZE_POOL};
    ASSERT_FALSE(write_vault_boost_hook_genesis(genesis, config).has_error());

    auto const &account = genesis["alloc"][evmc::hex(HOOK_CA)];
    EXPECT_EQ(account["wei_balance"], "7");
    auto const &storage = account["storage"];
    ASSERT_EQ(storage.size(), 2);
    EXPECT_EQ(
        storage
            ["0x0000000000000000000000000000000000000000000000000000000000000005"],
        "0x000000000000000000000000000000000000000000000000000000000000002a");
    EXPECT_TRUE(storage.contains(
        "0x0000000000000000000000000000000000000000000000000000000000000001"));
}

TEST(VaultBoostHookConfig, write_genesis_malformed_storage)
{
    for (auto const &bad :
         {nlohmann::json{{"0xzz", "0x01"}},
          nlohmann::json{{"0x01", 1}},
          nlohmann::json{
              {"0x01",
               "0x000000000000000000000000000000000000000000000000000000000000"
               "000001"}},
          nlohmann::json::array()}) {
        auto genesis = make_genesis();
        genesis["alloc"][evmc::hex(HOOK_CA)]["storage"] = bad;
        auto const before = genesis;

        VaultBoostHookConfig const config{
            .address = HOOK_CA, .prize_pool = PRIZE_POOL};
        auto const res = write_vault_boost_hook_genesis(genesis, config);
        ASSERT_TRUE(res.has_error()) << bad.dump();
        EXPECT_EQ(res.assume_error(), VaultBoostHookError::InvalidConfig);
        EXPECT_EQ(genesis, before);
    }
}

TEST(VaultBoostHookConfig, save_genesis_file)
{
    auto const path = std::filesystem::temp_directory_path() /
                      "vaultboost_save_genesis_file.json";
    auto const genesis = make_genesis();
    ASSERT_FALSE(save_genesis_file(path, genesis).has_error());

    std::ifstream ifile(path);
    EXPECT_EQ(nlohmann::json::parse(ifile), genesis);
    ifile.close();
    std::filesystem::remove(path);
}

TEST(VaultBoostHookConfig, save_genesis_file_missing_directory)
{
    auto const path = std::filesystem::temp_directory_path() /
                      "vaultboost_no_such_directory" / "genesis.json";
    ASSERT_FALSE(std::filesystem::exists(path.parent_path()));

    auto const res = save_genesis_file(path, make_genesis());
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), VaultBoostHookError::GenesisWriteFailed);
}
