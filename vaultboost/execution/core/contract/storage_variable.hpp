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
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/state/state.hpp>

#include <cstring>
#include <optional>
#include <type_traits>

VAULTBOOST_NAMESPACE_BEGIN

// A typed view over a single storage slot of a contract account. The value
// occupies the leading bytes of the slot. An all zero slot reads as unset, so
// storing a zero value deletes the slot.
template <typename T>
    requires std::is_trivially_copyable_v<T> &&
             (sizeof(T) <= sizeof(bytes32_t))
class StorageVariable
{
    State &state_;
    Address const &address_;
    bytes32_t const key_;

    static T from_slot(bytes32_t const &slot) noexcept
    {
        T value{};
        std::memcpy(&value, slot.bytes, sizeof(T));
        return value;
    }

public:
    StorageVariable(State &state, Address const &address, bytes32_t const &key)
        : state_{state}
        , address_{address}
        , key_{key}
    {
    }

    T load() const noexcept
    {
        return from_slot(state_.get_storage(address_, key_));
    }

    std::optional<T> load_checked() const noexcept
    {
        auto const slot = state_.get_storage(address_, key_);
        if (slot == bytes32_t{}) {
            return std::nullopt;
        }
        return from_slot(slot);
    }

    void store(T const &value)
    {
        bytes32_t slot{};
        std::memcpy(slot.bytes, &value, sizeof(T));
        state_.set_storage(address_, key_, slot);
    }
};

VAULTBOOST_NAMESPACE_END
