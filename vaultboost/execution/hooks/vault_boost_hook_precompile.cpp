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
#include <vaultboost/core/likely.h>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/hooks/evmc_prize_pool_client.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_error.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_precompile.hpp>
#include <vaultboost/execution/state/state.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <optional>
#include <utility>

VAULTBOOST_NAMESPACE_BEGIN

std::optional<evmc::Result> check_call_vault_boost_hook(
    State &state, evmc::HostInterface &host, Address const &hook_address,
    evmc_message const &msg)
{
    if (msg.code_address != hook_address) {
        return std::nullopt;
    }

    if (VAULTBOOST_UNLIKELY(msg.kind != EVMC_CALL)) {
        return evmc::Result{evmc_status_code::EVMC_REJECTED};
    }

    byte_string_view input{msg.input_data, msg.input_size};
    auto const [method, cost] = VaultBoostHook::precompile_dispatch(input);
    if (VAULTBOOST_UNLIKELY(std::cmp_less(msg.gas, cost))) {
        return evmc::Result{evmc_status_code::EVMC_OUT_OF_GAS};
    }

    EvmcPrizePoolClient prize_pool_client{host, hook_address, msg.depth};
    VaultBoostHook hook{state, hook_address, prize_pool_client};

    auto const res = [&]() -> Result<byte_string> {
        if (VAULTBOOST_UNLIKELY(
                (msg.flags & EVMC_STATIC) && !VaultBoostHook::is_view(method))) {
            return VaultBoostHookError::StaticCallNotAllowed;
        }
        state.push();
        auto inner = (hook.*method)(input, msg.sender, msg.value);
        if (inner.has_value()) {
            state.pop_accept();
        }
        else {
            state.pop_reject();
        }
        return inner;
    }();

    if (VAULTBOOST_LIKELY(res.has_value())) {
        int64_t const gas_left = msg.gas - static_cast<int64_t>(cost);
        int64_t const gas_refund = 0;
        return evmc::Result(
            EVMC_SUCCESS,
            gas_left,
            gas_refund,
            res.value().data(),
            res.value().size());
    }

    auto const message = res.error().message();
    LOG_DEBUG(
        "VaultBoostHook: call from {} reverted: {}",
        evmc::hex(Address{msg.sender}),
        message.c_str());
    return evmc::Result(
        EVMC_REVERT,
        0 /* gas left */,
        0 /* gas refund */,
        reinterpret_cast<uint8_t const *>(message.data()),
        message.size());
}

VAULTBOOST_NAMESPACE_END
