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

#include <vaultboost/core/config.hpp>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>

#include <nlohmann/json_fwd.hpp>

#include <filesystem>

VAULTBOOST_NAMESPACE_BEGIN

// Deployment of the hook as read from the "vaultBoostHook" genesis entry:
//
//   "vaultBoostHook": { "address": "0x...", "prizePool": "0x..." }
struct VaultBoostHookConfig
{
    Address address;
    Address prize_pool;

    bool operator==(VaultBoostHookConfig const &) const = default;
};

Result<VaultBoostHookConfig>
read_vault_boost_hook_config(nlohmann::json const &genesis_json);

// Deploys the hook on top of the storage already in `alloc` of the genesis
// and writes the resulting storage back. The json is left untouched on error.
Result<void> write_vault_boost_hook_genesis(
    nlohmann::json &genesis_json, VaultBoostHookConfig const &);

Result<void> save_genesis_file(
    std::filesystem::path const &, nlohmann::json const &genesis_json);

VAULTBOOST_NAMESPACE_END
