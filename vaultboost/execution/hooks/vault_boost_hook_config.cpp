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

#include <vaultboost/core/byte_string.hpp>
#include <vaultboost/core/bytes.hpp>
#include <vaultboost/core/likely.h>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_config.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_error.hpp>
#include <vaultboost/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>

#include <nlohmann/json.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

VAULTBOOST_ANONYMOUS_NAMESPACE_BEGIN

std::optional<Address>
read_address(nlohmann::json const &object, char const *const field)
{
    if (!object.contains(field) || !object[field].is_string()) {
        LOG_ERROR("vaultBoostHook.{} is missing", field);
        return std::nullopt;
    }

    auto const hex = object[field].get<std::string>();
    auto const bytes = evmc::from_hex(hex);
    if (VAULTBOOST_UNLIKELY(
            !bytes.has_value() || bytes.value().size() != sizeof(Address))) {
        LOG_ERROR("vaultBoostHook.{} is not an address: {}", field, hex);
        return std::nullopt;
    }

    Address address{};
    std::copy_n(bytes.value().begin(), sizeof(Address), address.bytes);
    return address;
}

// genesis storage words are right aligned when shorter than 32 bytes
std::optional<bytes32_t> read_storage_word(std::string const &hex)
{
    auto const bytes = evmc::from_hex(hex);
    if (VAULTBOOST_UNLIKELY(
            !bytes.has_value() || bytes.value().size() > sizeof(bytes32_t))) {
        return std::nullopt;
    }

    bytes32_t result{};
    std::copy(
        bytes.value().begin(),
        bytes.value().end(),
        result.bytes + sizeof(bytes32_t) - bytes.value().size());
    return result;
}

Result<void> load_genesis_storage(
    nlohmann::json const &genesis_json, Address const &address, State &state)
{
    auto const account = evmc::hex(address);
    if (!genesis_json.contains("alloc") ||
        !genesis_json["alloc"].contains(account) ||
        !genesis_json["alloc"][account].contains("storage")) {
        return outcome::success();
    }

    auto const &storage = genesis_json["alloc"][account]["storage"];
    if (VAULTBOOST_UNLIKELY(!storage.is_object())) {
        LOG_ERROR("alloc.{}.storage is not an object", account);
        return VaultBoostHookError::InvalidConfig;
    }
    for (auto const &[key, value] : storage.items()) {
        auto const slot = read_storage_word(key);
        auto const word = value.is_string()
                              ? read_storage_word(value.get<std::string>())
                              : std::nullopt;
        if (VAULTBOOST_UNLIKELY(!slot.has_value() || !word.has_value())) {
            LOG_ERROR("alloc.{}.storage has a malformed slot {}", account, key);
            return VaultBoostHookError::InvalidConfig;
        }
        state.set_storage(address, slot.value(), word.value());
    }
    return outcome::success();
}

VAULTBOOST_ANONYMOUS_NAMESPACE_END

VAULTBOOST_NAMESPACE_BEGIN

Result<VaultBoostHookConfig>
read_vault_boost_hook_config(nlohmann::json const &genesis_json)
{
    if (!genesis_json.contains("vaultBoostHook") ||
        !genesis_json["vaultBoostHook"].is_object()) {
        return VaultBoostHookError::InvalidConfig;
    }
    auto const &entry = genesis_json["vaultBoostHook"];

    auto const address = read_address(entry, "address");
    auto const prize_pool = read_address(entry, "prizePool");
    if (VAULTBOOST_UNLIKELY(!address.has_value() || !prize_pool.has_value())) {
        return VaultBoostHookError::InvalidConfig;
    }

    return VaultBoostHookConfig{
        .address = address.value(), .prize_pool = prize_pool.value()};
}

Result<void> write_vault_boost_hook_genesis(
    nlohmann::json &genesis_json, VaultBoostHookConfig const &config)
{
    State state;
    BOOST_OUTCOME_TRY(
        load_genesis_storage(genesis_json, config.address, state));
    BOOST_OUTCOME_TRY(
        VaultBoostHook::deploy(state, config.address, config.prize_pool));

    // alloc keys carry no 0x prefix
    auto &account = genesis_json["alloc"][evmc::hex(config.address)];
    if (!account.contains("wei_balance")) {
        account["wei_balance"] = "0";
    }

    // rewritten from the state, so keys and words come out in full width
    auto &storage = account["storage"];
    storage = nlohmann::json::object();
    for (auto const &[key, value] : state.get_storage_slots(config.address)) {
        storage["0x" + evmc::hex(key)] = "0x" + evmc::hex(value);
    }

    LOG_INFO(
        "wrote {} storage slots of hook {}",
        storage.size(),
        evmc::hex(config.address));
    return outcome::success();
}

Result<void> save_genesis_file(
    std::filesystem::path const &path, nlohmann::json const &genesis_json)
{
    std::ofstream ofile(path);
    if (VAULTBOOST_UNLIKELY(!ofile)) {
        LOG_ERROR("could not open {} for writing", path.string());
        return VaultBoostHookError::GenesisWriteFailed;
    }

    ofile << genesis_json.dump(4) << '\n';
    ofile.flush();
    if (VAULTBOOST_UNLIKELY(!ofile)) {
        LOG_ERROR("writing {} failed", path.string());
        return VaultBoostHookError::GenesisWriteFailed;
    }
    return outcome::success();
}

VAULTBOOST_NAMESPACE_END
