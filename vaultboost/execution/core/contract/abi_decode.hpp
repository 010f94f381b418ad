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
#include <vaultboost/core/likely.h>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/contract/abi_decode_error.hpp>
#include <vaultboost/execution/core/contract/big_endian.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

VAULTBOOST_NAMESPACE_BEGIN

// Decoders for solidity ABI encoded call data. Each decoder consumes the words
// it reads from the front of the input and rejects values a solidity decoder
// would reject (dirty padding, out of range integers, bad offsets).

namespace detail
{
    inline bool is_zero(byte_string_view const bytes) noexcept
    {
        return std::all_of(bytes.begin(), bytes.end(), [](uint8_t const b) {
            return b == 0;
        });
    }
}

template <typename T>
    requires(BigEndianType<T> || std::is_same_v<T, Address>)
Result<T> abi_decode_fixed(byte_string_view &input)
{
    static_assert(sizeof(T) <= sizeof(bytes32_t));

    if (VAULTBOOST_UNLIKELY(input.size() < sizeof(bytes32_t))) {
        return AbiDecodeError::InputTooShort;
    }

    constexpr size_t offset = sizeof(bytes32_t) - sizeof(T);
    if (VAULTBOOST_UNLIKELY(!detail::is_zero(input.substr(0, offset)))) {
        if constexpr (std::is_same_v<T, Address>) {
            return AbiDecodeError::InvalidPadding;
        }
        else {
            return AbiDecodeError::ValueOutOfRange;
        }
    }

    T value{};
    std::memcpy(&value, input.data() + offset, sizeof(T));
    input.remove_prefix(sizeof(bytes32_t));
    return value;
}

// uintN for widths without a native type, e.g. uint96
inline Result<uint256_t>
abi_decode_uint(byte_string_view &input, unsigned const bits)
{
    BOOST_OUTCOME_TRY(auto const word, abi_decode_fixed<u256_be>(input));
    auto const value = word.native();
    if (VAULTBOOST_UNLIKELY(bits < 256 && (value >> bits) != 0)) {
        return AbiDecodeError::ValueOutOfRange;
    }
    return value;
}

// Resolves a dynamic `bytes` argument. `args` is the whole encoded tuple and
// `offset` the head word pointing into it.
inline Result<byte_string_view>
abi_decode_bytes(byte_string_view const args, u256_be const &offset)
{
    auto const start = offset.native();
    if (VAULTBOOST_UNLIKELY(
            start > args.size() || args.size() - start < sizeof(bytes32_t))) {
        return AbiDecodeError::InvalidOffset;
    }

    byte_string_view tail = args.substr(static_cast<size_t>(start));
    BOOST_OUTCOME_TRY(auto const length, abi_decode_fixed<u256_be>(tail));
    if (VAULTBOOST_UNLIKELY(length.native() > tail.size())) {
        return AbiDecodeError::InvalidOffset;
    }
    return tail.substr(0, static_cast<size_t>(length.native()));
}

VAULTBOOST_NAMESPACE_END
