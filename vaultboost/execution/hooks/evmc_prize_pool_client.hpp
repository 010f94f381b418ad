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
#include <vaultboost/core/config.hpp>
#include <vaultboost/core/int.hpp>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/contract/abi_signatures.hpp>
#include <vaultboost/execution/hooks/prize_pool_client.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <cstdint>

VAULTBOOST_NAMESPACE_BEGIN

struct PrizePoolSelector
{
    static constexpr uint32_t NUMBER_OF_TIERS =
        abi_encode_selector("numberOfTiers()");
    static constexpr uint32_t CONTRIBUTE_PRIZE_TOKENS =
        abi_encode_selector("contributePrizeTokens(address,uint256)");
};

static_assert(PrizePoolSelector::NUMBER_OF_TIERS == 0x6e27a2e5);
static_assert(PrizePoolSelector::CONTRIBUTE_PRIZE_TOKENS == 0xeedfb450);

// Reaches the prize pool with regular EVM message calls sent from the hook
// account through the host executing the hook.
class EvmcPrizePoolClient final : public PrizePoolClient
{
    evmc::HostInterface &host_;
    Address const &hook_;
    int32_t const depth_;

    Result<byte_string> call(
        Address const &prize_pool, byte_string const &input, int64_t gas,
        uint32_t flags);

public:
    EvmcPrizePoolClient(
        evmc::HostInterface &, Address const &hook, int32_t depth);

    Result<uint8_t> number_of_tiers(Address const &prize_pool) override;

    Result<void> contribute_prize_tokens(
        Address const &prize_pool, Address const &beneficiary,
        uint256_t const &amount) override;
};

VAULTBOOST_NAMESPACE_END
