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

#include <cstddef>
#include <cstdint>
#include <string_view>

VAULTBOOST_NAMESPACE_BEGIN

namespace detail
{
    inline constexpr uint64_t KECCAK_ROUND_CONSTANTS[24] = {
        0x0000000000000001, 0x0000000000008082, 0x800000000000808a,
        0x8000000080008000, 0x000000000000808b, 0x0000000080000001,
        0x8000000080008081, 0x8000000000008009, 0x000000000000008a,
        0x0000000000000088, 0x0000000080008009, 0x000000008000000a,
        0x000000008000808b, 0x800000000000008b, 0x8000000000008089,
        0x8000000000008003, 0x8000000000008002, 0x8000000000000080,
        0x000000000000800a, 0x800000008000000a, 0x8000000080008081,
        0x8000000000008080, 0x0000000080000001, 0x8000000080008008};

    inline constexpr unsigned KECCAK_ROTATIONS[24] = {
        1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
        27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44};

    inline constexpr unsigned KECCAK_LANES[24] = {
        10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
        15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1};

    constexpr uint64_t rotl64(uint64_t const x, unsigned const n) noexcept
    {
        return (x << n) | (x >> (64 - n));
    }

    constexpr void keccak_f1600(uint64_t (&st)[25]) noexcept
    {
        for (uint64_t const rc : KECCAK_ROUND_CONSTANTS) {
            uint64_t bc[5]{};

            // theta
            for (size_t i = 0; i < 5; ++i) {
                bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^
                        st[i + 20];
            }
            for (size_t i = 0; i < 5; ++i) {
                uint64_t const t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
                for (size_t j = 0; j < 25; j += 5) {
                    st[j + i] ^= t;
                }
            }

            // rho, pi
            uint64_t t = st[1];
            for (size_t i = 0; i < 24; ++i) {
                unsigned const j = KECCAK_LANES[i];
                uint64_t const next = st[j];
                st[j] = rotl64(t, KECCAK_ROTATIONS[i]);
                t = next;
            }

            // chi
            for (size_t j = 0; j < 25; j += 5) {
                for (size_t i = 0; i < 5; ++i) {
                    bc[i] = st[j + i];
                }
                for (size_t i = 0; i < 5; ++i) {
                    st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
                }
            }

            // iota
            st[0] ^= rc;
        }
    }
}

// Keccak-256 as used by solidity, evaluated at compile time so selectors and
// event topics can be checked with static_assert.
constexpr bytes32_t keccak256(std::string_view const input) noexcept
{
    constexpr size_t RATE = 136;

    uint64_t st[25]{};
    auto const absorb = [&st](size_t const pos, uint8_t const b) {
        st[pos / 8] ^= static_cast<uint64_t>(b) << (8 * (pos % 8));
    };

    size_t i = 0;
    for (; input.size() - i >= RATE; i += RATE) {
        for (size_t k = 0; k < RATE; ++k) {
            absorb(k, static_cast<uint8_t>(input[i + k]));
        }
        detail::keccak_f1600(st);
    }

    size_t const rem = input.size() - i;
    for (size_t k = 0; k < rem; ++k) {
        absorb(k, static_cast<uint8_t>(input[i + k]));
    }
    absorb(rem, 0x01);
    absorb(RATE - 1, 0x80);
    detail::keccak_f1600(st);

    bytes32_t output{};
    for (size_t k = 0; k < sizeof(bytes32_t); ++k) {
        output.bytes[k] = static_cast<uint8_t>(st[k / 8] >> (8 * (k % 8)));
    }
    return output;
}

// First four bytes of the signature hash, read big endian
constexpr uint32_t abi_encode_selector(std::string_view const signature) noexcept
{
    auto const hash = keccak256(signature);
    return static_cast<uint32_t>(hash.bytes[0]) << 24 |
           static_cast<uint32_t>(hash.bytes[1]) << 16 |
           static_cast<uint32_t>(hash.bytes[2]) << 8 |
           static_cast<uint32_t>(hash.bytes[3]);
}

constexpr bytes32_t
abi_encode_event_signature(std::string_view const signature) noexcept
{
    return keccak256(signature);
}

VAULTBOOST_NAMESPACE_END
