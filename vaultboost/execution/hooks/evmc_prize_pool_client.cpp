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
#include <vaultboost/execution/core/contract/big_endian.hpp>
#include <vaultboost/execution/hooks/constants.hpp>
#include <vaultboost/execution/hooks/evmc_prize_pool_client.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_error.hpp>

#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <evmc/helpers.h>
#include <evmc/hex.hpp>

#include <quill/Quill.h>

#include <cstdint>

VAULTBOOST_ANONYMOUS_NAMESPACE_BEGIN

// EVM call depth limit
constexpr int32_t MAX_CALL_DEPTH = 1024;

VAULTBOOST_ANONYMOUS_NAMESPACE_END

VAULTBOOST_NAMESPACE_BEGIN

EvmcPrizePoolClient::EvmcPrizePoolClient(
    evmc::HostInterface &host, Address const &hook, int32_t const depth)
    : host_{host}
    , hook_{hook}
    , depth_{depth}
{
}

Result<byte_string> EvmcPrizePoolClient::call(
    Address const &prize_pool, byte_string const &input, int64_t const gas,
    uint32_t const flags)
{
    if (VAULTBOOST_UNLIKELY(depth_ >= MAX_CALL_DEPTH)) {
        LOG_ERROR(
            "VaultBoostHook: prize pool call at depth {} exceeds the call "
            "depth limit",
            depth_ + 1);
        return VaultBoostHookError::PrizePoolCallFailed;
    }

    auto const msg = evmc_message{
        .kind = EVMC_CALL,
        .flags = flags,
        .depth = depth_ + 1,
        .gas = gas,
        .recipient = prize_pool,
        .sender = hook_,
        .input_data = input.data(),
        .input_size = input.size(),
        .value = {},
        .create2_salt = {},
        .code_address = prize_pool,
    };

    auto const result = host_.call(msg);
    if (VAULTBOOST_UNLIKELY(result.status_code != EVMC_SUCCESS)) {
        LOG_ERROR(
            "VaultBoostHook: prize pool {} call failed with status {}",
            evmc::hex(prize_pool),
            evmc_status_code_to_string(result.status_code));
        return VaultBoostHookError::PrizePoolCallFailed;
    }
    return byte_string(result.output_data, result.output_size);
}

Result<uint8_t> EvmcPrizePoolClient::number_of_tiers(Address const &prize_pool)
{
    auto const input = abi_encode_call(PrizePoolSelector::NUMBER_OF_TIERS, {});
    BOOST_OUTCOME_TRY(
        auto const output,
        call(prize_pool, input, PRIZE_POOL_VIEW_CALL_GAS, EVMC_STATIC));

    byte_string_view view{output};
    auto const tiers = abi_decode_fixed<uint8_t>(view);
    if (VAULTBOOST_UNLIKELY(tiers.has_error())) {
        LOG_ERROR(
            "VaultBoostHook: malformed numberOfTiers() output from {}: 0x{}",
            evmc::hex(prize_pool),
            evmc::hex(output));
        return VaultBoostHookError::PrizePoolCallFailed;
    }
    return tiers.value();
}

Result<void> EvmcPrizePoolClient::contribute_prize_tokens(
    Address const &prize_pool, Address const &beneficiary,
    uint256_t const &amount)
{
    auto const input = abi_encode_call(
        PrizePoolSelector::CONTRIBUTE_PRIZE_TOKENS,
        {abi_encode_address(beneficiary), abi_encode_uint(amount)});
    BOOST_OUTCOME_TRY(
        call(prize_pool, input, PRIZE_POOL_CONTRIBUTE_CALL_GAS, 0));
    return outcome::success();
}

VAULTBOOST_NAMESPACE_END
