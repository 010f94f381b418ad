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
#include <vaultboost/core/int.hpp>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>

#include <cstdint>

VAULTBOOST_NAMESPACE_BEGIN

// Calls the hook makes into a PrizePool contract
class PrizePoolClient
{
public:
    virtual ~PrizePoolClient() = default;

    // PrizePool.numberOfTiers()
    virtual Result<uint8_t> number_of_tiers(Address const &prize_pool) = 0;

    // PrizePool.contributePrizeTokens(address,uint256)
    virtual Result<void> contribute_prize_tokens(
        Address const &prize_pool, Address const &beneficiary,
        uint256_t const &amount) = 0;
};

VAULTBOOST_NAMESPACE_END
