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
#include <vaultboost/core/int.hpp>
#include <vaultboost/core/likely.h>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/contract/abi_decode.hpp>
#include <vaultboost/execution/core/contract/abi_encode.hpp>
#include <vaultboost/execution/core/contract/abi_signatures.hpp>
#include <vaultboost/execution/core/contract/big_endian.hpp>
#include <vaultboost/execution/core/contract/events.hpp>
#include <vaultboost/execution/core/contract/storage_variable.hpp>
#include <vaultboost/execution/hooks/constants.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_error.hpp>
#include <vaultboost/execution/state/state.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>

#include <intx/intx.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <utility>

VAULTBOOST_ANONYMOUS_NAMESPACE_BEGIN

////////////////////////
// Function Selectors //
////////////////////////

struct PrecompileSelector
{
    static constexpr uint32_t SET_BENEFICIARY =
        abi_encode_selector("setBeneficiary(address)");
    static constexpr uint32_t BEFORE_CLAIM_PRIZE = abi_encode_selector(
        "beforeClaimPrize(address,uint8,uint32,uint96,address)");
    static constexpr uint32_t AFTER_CLAIM_PRIZE = abi_encode_selector(
        "afterClaimPrize(address,uint8,uint32,uint256,address,bytes)");
    static constexpr uint32_t VAULT_BENEFICIARY =
        abi_encode_selector("vaultBeneficiary(address)");
    static constexpr uint32_t PRIZE_POOL = abi_encode_selector("prizePool()");
};

static_assert(PrecompileSelector::SET_BENEFICIARY == 0x1c31f710);
static_assert(PrecompileSelector::BEFORE_CLAIM_PRIZE == 0xb4db727f);
static_assert(PrecompileSelector::AFTER_CLAIM_PRIZE == 0xd44c6da3);
static_assert(PrecompileSelector::VAULT_BENEFICIARY == 0x3f5889a9);
static_assert(PrecompileSelector::PRIZE_POOL == 0x719ce73e);

///////////////
// Gas Costs //
///////////////

// The gas for the hook precompile is determined by sloads, sstores, events
// and the calls it makes into the prize pool. The operations are given as the
// following:
//
// operations = [
//   number_of_cold_sloads,
//   number_of_warm_nonzero_sstores,
//   number_of_events,
//   number_of_view_calls,
//   number_of_contribute_calls,
//   ]
//
// The gas cost is calculated as:
// gas = COLD_SLOAD_COST * operations[0] +
//       WARM_NONZERO_SSTORE_COST * operations[1] +
//       EVENT_COST * operations[2] +
//       (COLD_ACCOUNT_ACCESS + PRIZE_POOL_VIEW_CALL_GAS) * operations[3] +
//       (COLD_ACCOUNT_ACCESS + PRIZE_POOL_CONTRIBUTE_CALL_GAS) * operations[4]
//
// Gas forwarded to the prize pool is charged in full; what the prize pool
// leaves unused is not returned.

constexpr uint64_t COLD_SLOAD = 8100;
constexpr uint64_t WARM_SSTORE_NONZERO = 2900;
constexpr uint64_t EVENT_COSTS = 4275;
constexpr uint64_t COLD_ACCOUNT_ACCESS = 2600;

struct OpCount
{
    uint64_t cold_sloads;
    uint64_t warm_sstore_nonzero;
    uint64_t events;
    uint64_t view_calls;
    uint64_t contribute_calls;
};

constexpr uint64_t compute_costs(OpCount const &ops) noexcept
{
    return COLD_SLOAD * ops.cold_sloads +
           WARM_SSTORE_NONZERO * ops.warm_sstore_nonzero +
           EVENT_COSTS * ops.events +
           (COLD_ACCOUNT_ACCESS +
            static_cast<uint64_t>(PRIZE_POOL_VIEW_CALL_GAS)) *
               ops.view_calls +
           (COLD_ACCOUNT_ACCESS +
            static_cast<uint64_t>(PRIZE_POOL_CONTRIBUTE_CALL_GAS)) *
               ops.contribute_calls;
}

constexpr uint64_t SET_BENEFICIARY_OP_COST = compute_costs({
    .cold_sloads = 2,
    .warm_sstore_nonzero = 1,
    .events = 1,
    .view_calls = 0,
    .contribute_calls = 0,
});

constexpr uint64_t BEFORE_CLAIM_PRIZE_OP_COST = compute_costs({
    .cold_sloads = 2,
    .warm_sstore_nonzero = 0,
    .events = 0,
    .view_calls = 1,
    .contribute_calls = 0,
});

constexpr uint64_t AFTER_CLAIM_PRIZE_OP_COST = compute_costs({
    .cold_sloads = 2,
    .warm_sstore_nonzero = 0,
    .events = 1,
    .view_calls = 0,
    .contribute_calls = 1,
});

constexpr uint64_t VAULT_BENEFICIARY_OP_COST = compute_costs({
    .cold_sloads = 2,
    .warm_sstore_nonzero = 0,
    .events = 0,
    .view_calls = 0,
    .contribute_calls = 0,
});

constexpr uint64_t PRIZE_POOL_OP_COST = compute_costs({
    .cold_sloads = 1,
    .warm_sstore_nonzero = 0,
    .events = 0,
    .view_calls = 0,
    .contribute_calls = 0,
});

constexpr uint64_t FALLBACK_COST = 40'000;

static_assert(SET_BENEFICIARY_OP_COST == 23375);
static_assert(BEFORE_CLAIM_PRIZE_OP_COST == 48800);
static_assert(AFTER_CLAIM_PRIZE_OP_COST == 173075);
static_assert(VAULT_BENEFICIARY_OP_COST == 16200);
static_assert(PRIZE_POOL_OP_COST == 8100);

Result<void> function_not_payable(u256_be const &value)
{
    if (VAULTBOOST_UNLIKELY(!value.is_zero())) {
        return VaultBoostHookError::ValueNonZero;
    }

    return outcome::success();
}

// Decoding failures of call data all surface as InvalidInput
template <typename T>
Result<T> check_input(Result<T> &&res)
{
    if (VAULTBOOST_UNLIKELY(res.has_error())) {
        LOG_DEBUG(
            "VaultBoostHook: malformed call data: {}",
            res.assume_error().message().c_str());
        return VaultBoostHookError::InvalidInput;
    }
    return std::move(res).assume_value();
}

VAULTBOOST_ANONYMOUS_NAMESPACE_END

VAULTBOOST_NAMESPACE_BEGIN

VaultBoostHook::VaultBoostHook(
    State &state, Address const &ca, PrizePoolClient &prize_pool_client)
    : state_{state}
    , ca_{ca}
    , prize_pool_client_{prize_pool_client}
    , vars{state, ca}
{
}

Result<void> VaultBoostHook::deploy(
    State &state, Address const &ca, Address const &prize_pool)
{
    if (VAULTBOOST_UNLIKELY(prize_pool == Address{})) {
        return VaultBoostHookError::PrizePoolAddressZero;
    }

    Variables vars{state, ca};
    if (VAULTBOOST_UNLIKELY(vars.prize_pool.load_checked().has_value())) {
        return VaultBoostHookError::AlreadyDeployed;
    }
    vars.prize_pool.store(prize_pool);

    LOG_INFO(
        "VaultBoostHook: deployed at {} for prize pool {}",
        evmc::hex(ca),
        evmc::hex(prize_pool));
    return outcome::success();
}

Result<Address> VaultBoostHook::prize_pool()
{
    auto const prize_pool = vars.prize_pool.load_checked();
    if (VAULTBOOST_UNLIKELY(!prize_pool.has_value())) {
        return VaultBoostHookError::NotDeployed;
    }
    return prize_pool.value();
}

Address VaultBoostHook::vault_beneficiary(Address const &booster)
{
    return vars.vault_beneficiary(booster).load();
}

void VaultBoostHook::set_beneficiary(
    Address const &booster, Address const &vault)
{
    vars.vault_beneficiary(booster).store(vault);
    emit_set_vault_beneficiary_event(booster, vault);
}

Result<Address>
VaultBoostHook::before_claim_prize(Address const &winner, uint8_t const tier)
{
    BOOST_OUTCOME_TRY(auto const prize_pool, this->prize_pool());

    if (vault_beneficiary(winner) == Address{}) {
        return winner;
    }

    BOOST_OUTCOME_TRY(
        auto const number_of_tiers,
        prize_pool_client_.number_of_tiers(prize_pool));
    if (VAULTBOOST_UNLIKELY(number_of_tiers < NUMBER_OF_CANARY_TIERS + 1)) {
        LOG_WARNING(
            "VaultBoostHook: prize pool {} reports {} tiers, fewer than the "
            "{} canary tiers plus a daily tier",
            evmc::hex(prize_pool),
            unsigned{number_of_tiers},
            unsigned{NUMBER_OF_CANARY_TIERS});
        return VaultBoostHookError::InvalidTierConfiguration;
    }

    auto const daily_tier =
        static_cast<uint8_t>(number_of_tiers - NUMBER_OF_CANARY_TIERS - 1);
    if (tier < daily_tier) {
        return winner;
    }

    LOG_DEBUG(
        "VaultBoostHook: redirecting tier {} prize of {} to prize pool",
        unsigned{tier},
        evmc::hex(winner));
    return prize_pool;
}

Result<void> VaultBoostHook::after_claim_prize(
    Address const &winner, uint256_t const &prize,
    Address const &prize_recipient)
{
    BOOST_OUTCOME_TRY(auto const prize_pool, this->prize_pool());

    if (prize_recipient != prize_pool || prize == 0) {
        LOG_DEBUG(
            "VaultBoostHook: nothing to boost for {}", evmc::hex(winner));
        return outcome::success();
    }

    // Read again rather than trusting what before_claim_prize saw
    auto const beneficiary = vault_beneficiary(winner);
    BOOST_OUTCOME_TRY(prize_pool_client_.contribute_prize_tokens(
        prize_pool, beneficiary, prize));
    emit_boosted_prize_vault_event(prize_pool, beneficiary, winner, prize);

    LOG_INFO(
        "VaultBoostHook: {} boosted vault {} with {}",
        evmc::hex(winner),
        evmc::hex(beneficiary),
        intx::to_string(prize));
    return outcome::success();
}

////////////
// Events //
////////////

void VaultBoostHook::emit_set_vault_beneficiary_event(
    Address const &booster, Address const &beneficiary)
{
    static constexpr auto signature =
        abi_encode_event_signature("SetVaultBeneficiary(address,address)");
    static_assert(
        signature ==
        0x5490a80d86c2a351eeec7b8c6c42fcd99f81efb9fd77667a664cad90dab401b7_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .indexed(booster)
                           .indexed(beneficiary)
                           .build();
    state_.store_log(event);
}

void VaultBoostHook::emit_boosted_prize_vault_event(
    Address const &prize_pool, Address const &beneficiary,
    Address const &booster, uint256_t const &amount)
{
    static constexpr auto signature = abi_encode_event_signature(
        "BoostedPrizeVault(address,address,address,uint256)");
    static_assert(
        signature ==
        0x81a7ae931d4a7cbcf438f2e399de8c0d85c33ae8a3c54a1d68b8b96375f93125_bytes32);

    auto const event = EventBuilder(ca_, signature)
                           .indexed(prize_pool)
                           .indexed(beneficiary)
                           .indexed(booster)
                           .data(amount)
                           .build();
    state_.store_log(event);
}

/////////////////
// Precompiles //
/////////////////

std::pair<VaultBoostHook::PrecompileFunc, uint64_t>
VaultBoostHook::precompile_dispatch(byte_string_view &input)
{
    if (VAULTBOOST_UNLIKELY(input.size() < 4)) {
        return {&VaultBoostHook::precompile_fallback, FALLBACK_COST};
    }

    auto const signature =
        intx::be::unsafe::load<uint32_t>(input.substr(0, 4).data());
    input.remove_prefix(4);

    switch (signature) {
    case PrecompileSelector::SET_BENEFICIARY:
        return {
            &VaultBoostHook::precompile_set_beneficiary,
            SET_BENEFICIARY_OP_COST};
    case PrecompileSelector::BEFORE_CLAIM_PRIZE:
        return {
            &VaultBoostHook::precompile_before_claim_prize,
            BEFORE_CLAIM_PRIZE_OP_COST};
    case PrecompileSelector::AFTER_CLAIM_PRIZE:
        return {
            &VaultBoostHook::precompile_after_claim_prize,
            AFTER_CLAIM_PRIZE_OP_COST};
    case PrecompileSelector::VAULT_BENEFICIARY:
        return {
            &VaultBoostHook::precompile_vault_beneficiary,
            VAULT_BENEFICIARY_OP_COST};
    case PrecompileSelector::PRIZE_POOL:
        return {&VaultBoostHook::precompile_prize_pool, PRIZE_POOL_OP_COST};
    default:
        return {&VaultBoostHook::precompile_fallback, FALLBACK_COST};
    }
}

bool VaultBoostHook::is_view(PrecompileFunc const func)
{
    return func == &VaultBoostHook::precompile_before_claim_prize ||
           func == &VaultBoostHook::precompile_vault_beneficiary ||
           func == &VaultBoostHook::precompile_prize_pool ||
           func == &VaultBoostHook::precompile_fallback;
}

Result<byte_string> VaultBoostHook::precompile_set_beneficiary(
    byte_string_view input, evmc_address const &sender,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));

    if (VAULTBOOST_UNLIKELY(input.size() != sizeof(bytes32_t) /* vault */)) {
        return VaultBoostHookError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(
        auto const vault, check_input(abi_decode_fixed<Address>(input)));

    BOOST_OUTCOME_TRY(prize_pool());

    set_beneficiary(sender, vault);
    return byte_string{};
}

Result<byte_string> VaultBoostHook::precompile_before_claim_prize(
    byte_string_view input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));

    constexpr size_t MESSAGE_SIZE = 5 * sizeof(bytes32_t);
    if (VAULTBOOST_UNLIKELY(input.size() != MESSAGE_SIZE)) {
        return VaultBoostHookError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(
        auto const winner, check_input(abi_decode_fixed<Address>(input)));
    BOOST_OUTCOME_TRY(
        auto const tier, check_input(abi_decode_fixed<uint8_t>(input)));
    BOOST_OUTCOME_TRY(check_input(abi_decode_fixed<u32_be>(input))); // index
    BOOST_OUTCOME_TRY(check_input(abi_decode_uint(input, 96))); // reward
    BOOST_OUTCOME_TRY(check_input(abi_decode_fixed<Address>(input)));

    BOOST_OUTCOME_TRY(auto const recipient, before_claim_prize(winner, tier));

    AbiEncoder encoder;
    encoder.add_address(recipient);
    encoder.add_bytes({});
    return encoder.encode_final();
}

Result<byte_string> VaultBoostHook::precompile_after_claim_prize(
    byte_string_view input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));

    byte_string_view const args = input;
    BOOST_OUTCOME_TRY(
        auto const winner, check_input(abi_decode_fixed<Address>(input)));
    BOOST_OUTCOME_TRY(check_input(abi_decode_fixed<uint8_t>(input))); // tier
    BOOST_OUTCOME_TRY(check_input(abi_decode_fixed<u32_be>(input))); // index
    BOOST_OUTCOME_TRY(
        auto const prize, check_input(abi_decode_fixed<u256_be>(input)));
    BOOST_OUTCOME_TRY(
        auto const prize_recipient,
        check_input(abi_decode_fixed<Address>(input)));
    BOOST_OUTCOME_TRY(
        auto const data_offset, check_input(abi_decode_fixed<u256_be>(input)));

    // hook data is unused but must be well formed
    BOOST_OUTCOME_TRY(check_input(abi_decode_bytes(args, data_offset)));

    BOOST_OUTCOME_TRY(
        after_claim_prize(winner, prize.native(), prize_recipient));
    return byte_string{};
}

Result<byte_string> VaultBoostHook::precompile_vault_beneficiary(
    byte_string_view input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));

    if (VAULTBOOST_UNLIKELY(input.size() != sizeof(bytes32_t) /* booster */)) {
        return VaultBoostHookError::InvalidInput;
    }
    BOOST_OUTCOME_TRY(
        auto const booster, check_input(abi_decode_fixed<Address>(input)));

    BOOST_OUTCOME_TRY(prize_pool());

    return byte_string{abi_encode_address(vault_beneficiary(booster))};
}

Result<byte_string> VaultBoostHook::precompile_prize_pool(
    byte_string_view const input, evmc_address const &,
    evmc_bytes32 const &msg_value)
{
    BOOST_OUTCOME_TRY(function_not_payable(u256_be::from_bytes(msg_value)));

    if (VAULTBOOST_UNLIKELY(!input.empty())) {
        return VaultBoostHookError::InvalidInput;
    }

    BOOST_OUTCOME_TRY(auto const prize_pool, this->prize_pool());
    return byte_string{abi_encode_address(prize_pool)};
}

Result<byte_string> VaultBoostHook::precompile_fallback(
    byte_string_view, evmc_address const &, evmc_bytes32 const &)
{
    return VaultBoostHookError::MethodNotSupported;
}

VAULTBOOST_NAMESPACE_END
