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
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/contract/abi_encode.hpp>
#include <vaultboost/execution/core/contract/big_endian.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

using namespace vaultboost;
using namespace intx::literals;

TEST(AbiEncode, u32)
{
    constexpr uint32_t input{4294967295};
    byte_string const expected =
        evmc::from_hex(
            "00000000000000000000000000000000000000000000000000000000ffffffff")
            .value();

    u32_be encoded = input;
    auto const output = byte_string{abi_encode_int(encoded)};
    EXPECT_EQ(output, expected);
}

TEST(AbiEncode, uint8)
{
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000007")
            .value();

    auto const output = byte_string{abi_encode_int(uint8_t{7})};
    EXPECT_EQ(output, expected);
}

TEST(AbiEncode, u256)
{
    constexpr uint256_t input{15355346523654236542356453_u256};
    byte_string const expected =
        evmc::from_hex(
            "0x0000000000000000000000000000000000000000000cb3"
            "9f00c54ee156444be5")
            .value();

    auto const output = byte_string{abi_encode_uint(input)};
    EXPECT_EQ(output, expected);
}

TEST(AbiEncode, address)
{
    constexpr Address input{0xDEADBEEF000000000000000000F00D0000000100_address};
    byte_string const expected =
        evmc::from_hex(
            "000000000000000000000000deadbeef000000000000000000f00d0000000100")
            .value();

    auto const output = byte_string{abi_encode_address(input)};
    EXPECT_EQ(output, expected);
}

TEST(AbiEncode, bytes)
{
    byte_string const input = evmc::from_hex("0xcafe").value();
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000002"
            "cafe000000000000000000000000000000000000000000000000000000000000")
            .value();

    EXPECT_EQ(abi_encode_bytes(input), expected);
}

TEST(AbiEncode, empty_bytes)
{
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000000")
            .value();

    EXPECT_EQ(abi_encode_bytes({}), expected);
}

TEST(AbiEncode, call)
{
    constexpr Address beneficiary{0x1111111111111111111111111111111111111111_address};
    byte_string const expected =
        evmc::from_hex(
            "eedfb450"
            "0000000000000000000000001111111111111111111111111111111111111111"
            "00000000000000000000000000000000000000000000000000000000000001f4")
            .value();

    auto const output = abi_encode_call(
        0xeedfb450,
        {abi_encode_address(beneficiary), abi_encode_uint(uint256_t{500})});
    EXPECT_EQ(output, expected);

    EXPECT_EQ(
        abi_encode_call(0x6e27a2e5, {}),
        evmc::from_hex("6e27a2e5").value());
}

// (address, bytes) as returned by a beforeClaimPrize hook
TEST(AbiEncode, address_and_empty_bytes)
{
    constexpr Address recipient{0x2222222222222222222222222222222222222222_address};
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000002222222222222222222222222222222222222222"
            "0000000000000000000000000000000000000000000000000000000000000040"
            "0000000000000000000000000000000000000000000000000000000000000000")
            .value();

    AbiEncoder encoder;
    encoder.add_address(recipient);
    encoder.add_bytes({});
    EXPECT_EQ(encoder.encode_final(), expected);
}

TEST(AbiEncode, mixed_tuple)
{
    constexpr Address account{0x3333333333333333333333333333333333333333_address};
    byte_string const data = evmc::from_hex("0x0102").value();
    byte_string const expected =
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000060"
            "0000000000000000000000003333333333333333333333333333333333333333"
            "000000000000000000000000000000000000000000000000000000000000002a"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0102000000000000000000000000000000000000000000000000000000000000")
            .value();

    AbiEncoder encoder;
    encoder.add_bytes(data);
    encoder.add_address(account);
    encoder.add_int(u32_be{uint32_t{42}});
    EXPECT_EQ(encoder.encode_final(), expected);
}
