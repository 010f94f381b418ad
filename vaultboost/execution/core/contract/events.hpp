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

#include <vaultboost/core/bytes.hpp>
#include <vaultboost/core/config.hpp>
#include <vaultboost/core/int.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/contract/abi_encode.hpp>
#include <vaultboost/execution/core/receipt.hpp>

#include <utility>

VAULTBOOST_NAMESPACE_BEGIN

// Builds a log the way solidity emits an event: topic 0 is the event
// signature, indexed parameters follow as topics and the rest is abi encoded
// into the data, one word per parameter.
class EventBuilder
{
    Receipt::Log log_;

public:
    explicit EventBuilder(Address const &emitter, bytes32_t const &signature)
    {
        log_.address = emitter;
        log_.topics.push_back(signature);
    }

    EventBuilder &indexed(Address const &address)
    {
        log_.topics.push_back(abi_encode_address(address));
        return *this;
    }

    EventBuilder &data(uint256_t const &value)
    {
        auto const word = abi_encode_uint(value);
        log_.data.append(word.bytes, sizeof(word.bytes));
        return *this;
    }

    Receipt::Log build()
    {
        return std::move(log_);
    }
};

VAULTBOOST_NAMESPACE_END
