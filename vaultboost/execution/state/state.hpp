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
#include <vaultboost/execution/core/receipt.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <utility>
#include <vector>

VAULTBOOST_NAMESPACE_BEGIN

// Account storage and logs of one transaction. Changes are made in nested
// checkpoints: push() opens one, pop_accept() folds it into the enclosing
// checkpoint and pop_reject() undoes every storage write and log made since
// the matching push().
class State
{
    template <class Key, class T>
    using Map = ankerl::unordered_dense::segmented_map<Key, T>;

    using Storage = Map<bytes32_t, bytes32_t>;

    struct Checkpoint
    {
        // value of each slot before its first write inside the checkpoint
        Map<Address, Storage> original;
        size_t num_logs;
    };

    Map<Address, Storage> storage_{};
    std::vector<Receipt::Log> logs_{};
    std::vector<Checkpoint> checkpoints_{};

    void write(Address const &, bytes32_t const &key, bytes32_t const &value);

public:
    State() = default;
    State(State const &) = delete;
    State(State &&) = default;
    State &operator=(State const &) = delete;
    State &operator=(State &&) = default;

    bytes32_t get_storage(Address const &, bytes32_t const &key) const;
    void set_storage(
        Address const &, bytes32_t const &key, bytes32_t const &value);

    // non-zero slots of an account, ordered by key
    std::vector<std::pair<bytes32_t, bytes32_t>>
    get_storage_slots(Address const &) const;

    void store_log(Receipt::Log const &);
    std::vector<Receipt::Log> const &logs() const;

    void push();
    void pop_accept();
    void pop_reject();
    size_t depth() const noexcept;
};

VAULTBOOST_NAMESPACE_END
