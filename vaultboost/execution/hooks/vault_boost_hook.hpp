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

#include <vaultboost/core/byte_string.hpp>
#include <vaultboost/core/bytes.hpp>
#include <vaultboost/core/config.hpp>
#include <vaultboost/core/int.hpp>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/contract/storage_variable.hpp>
#include <vaultboost/execution/hooks/prize_pool_client.hpp>

#include <evmc/evmc.h>

#include <bit>
#include <cstdint>
#include <utility>

VAULTBOOST_NAMESPACE_BEGIN

class State;

// Prize hooks that let a winner ("booster") send its daily tier prizes back
// into the prize pool as a contribution on behalf of a vault of its choice
// ("beneficiary").
class VaultBoostHook
{
    State &state_;
    Address const &ca_;
    PrizePoolClient &prize_pool_client_;

public:
    class Variables
    {
        State &state_;
        Address const &ca_;

        static constexpr auto AddressPrizePool{
            0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};

        // Prefixes for mappings
        enum : uint8_t
        {
            PrefixVaultBeneficiary = 0x01,
        };

    public:
        explicit Variables(State &state, Address const &ca)
            : state_{state}
            , ca_{ca}
        {
        }

        // address immutable prizePool, written once at deployment
        StorageVariable<Address> prize_pool{state_, ca_, AddressPrizePool};

        // mapping (address => address) vaultBeneficiary
        auto vault_beneficiary(Address const &booster) noexcept
        {
            struct
            {
                uint8_t mask;
                Address address;
                uint8_t slots[11];
            } key{
                .mask = PrefixVaultBeneficiary,
                .address = booster,
                .slots = {}};

            return StorageVariable<Address>(
                state_, ca_, std::bit_cast<bytes32_t>(key));
        }
    };

    Variables vars;

    VaultBoostHook(State &, Address const &ca, PrizePoolClient &);

    // Records the prize pool the hook at `ca` serves. Fails on the zero
    // address and when the hook is already deployed.
    static Result<void>
    deploy(State &, Address const &ca, Address const &prize_pool);

    Result<Address> prize_pool();

    // Zero address when boosting is disabled for the booster
    Address vault_beneficiary(Address const &booster);

    void set_beneficiary(Address const &booster, Address const &vault);

    // Recipient of the prize: the prize pool for daily tier prizes of a
    // booster with a beneficiary, otherwise the winner.
    Result<Address> before_claim_prize(Address const &winner, uint8_t tier);

    Result<void> after_claim_prize(
        Address const &winner, uint256_t const &prize,
        Address const &prize_recipient);

private:
    ////////////
    // Events //
    ////////////

    // event SetVaultBeneficiary(
    //     address indexed booster,
    //     address indexed beneficiary);
    void emit_set_vault_beneficiary_event(Address const &, Address const &);

    // event BoostedPrizeVault(
    //     address indexed prizePool,
    //     address indexed beneficiary,
    //     address indexed booster,
    //     uint256         amount);
    void emit_boosted_prize_vault_event(
        Address const &, Address const &, Address const &, uint256_t const &);

public:
    using PrecompileFunc = Result<byte_string> (VaultBoostHook::*)(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    /////////////////
    // Precompiles //
    /////////////////
    static std::pair<PrecompileFunc, uint64_t>
    precompile_dispatch(byte_string_view &);

    // Functions that may run in a static frame
    static bool is_view(PrecompileFunc);

    Result<byte_string> precompile_set_beneficiary(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_before_claim_prize(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_after_claim_prize(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_vault_beneficiary(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_prize_pool(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);

    Result<byte_string> precompile_fallback(
        byte_string_view, evmc_address const &, evmc_bytes32 const &);
};

VAULTBOOST_NAMESPACE_END
