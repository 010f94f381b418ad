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
#include <vaultboost/core/math.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/contract/big_endian.hpp>

#include <cstdint>
#include <initializer_list>
#include <cstring>
#include <utility>
#include <vector>

VAULTBOOST_NAMESPACE_BEGIN

// Helpers for encoding types into solidity encoding ABI. This is both for
// events and so return values from contracts can be parsed by solidity
// `abi.decode()`.

//////////////////////////////////////////////////////////////
// Standalone functions for encoding types.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
//////////////////////////////////////////////////////////////
inline bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    std::memcpy(&output.bytes[12], address.bytes, sizeof(Address));
    return output;
}

template <BigEndianType I>
bytes32_t abi_encode_int(I const &i)
{
    static_assert(sizeof(I) <= sizeof(bytes32_t));

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(I);
    bytes32_t output{};
    std::memcpy(&output.bytes[offset], &i, sizeof(I));
    return output;
}

inline bytes32_t abi_encode_uint(u256_be const &i)
{
    return abi_encode_int(i);
}

inline byte_string abi_encode_bytes(byte_string_view const input)
{
    byte_string output;
    u256_be const size{input.size()};
    size_t const padding =
        round_up(input.size(), sizeof(bytes32_t)) - input.size();
    output += abi_encode_int(size);
    output += input;
    output = output.append(padding, 0);
    return output;
}

// Encodes a function call: four byte selector followed by the argument words
inline byte_string abi_encode_call(
    uint32_t const selector, std::initializer_list<bytes32_t> const args)
{
    byte_string output(sizeof(uint32_t), 0);
    intx::be::unsafe::store(output.data(), selector);
    for (auto const &arg : args) {
        output += arg;
    }
    return output;
}

// Encodes a tuple
//  * static types : Have size <= 32 are padded out and added to the "head".
//  * dynamic types: size > 32. The "head" stores the offset in the tail, and
//                   the actual data is stored in the tail.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#formal-specification-of-the-encoding
class AbiEncoder
{
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(bytes32_t data)
    {
        head_ += data;
    }

    void add_dynamic(byte_string data)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        head_ += bytes32_t{};
        tail_ += data;
    }

public:
    void add_address(Address const &address)
    {
        add_static(abi_encode_address(address));
    }

    template <BigEndianType I>
    void add_int(I const &i)
    {
        add_static(abi_encode_int(i));
    }

    void add_bytes(byte_string_view const data)
    {
        add_dynamic(abi_encode_bytes(data));
    }

    byte_string encode_final()
    {
        for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
            u256_be offset = static_cast<uint256_t>(head_.size()) + tail_cumsum;
            uint8_t *const p = &head_[unresolved];
            bytes32_t encoded = abi_encode_int(offset);
            std::memcpy(p, encoded.bytes, sizeof(bytes32_t));
        }

        return std::move(head_) + std::move(tail_);
    }
};

VAULTBOOST_NAMESPACE_END
