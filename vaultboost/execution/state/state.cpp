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

#include <vaultboost/core/assert.h>
#include <vaultboost/core/bytes.hpp>
#include <vaultboost/core/likely.h>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/core/receipt.hpp>
#include <vaultboost/execution/state/state.hpp>

#include <algorithm>
#include <cstring>
#include <utility>
#include <vector>

VAULTBOOST_NAMESPACE_BEGIN

void State::write(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    if (value == bytes32_t{}) {
        auto const it = storage_.find(address);
        if (it != storage_.end()) {
            it->second.erase(key);
            if (it->second.empty()) {
                storage_.erase(it);
            }
        }
        return;
    }
    storage_[address][key] = value;
}

bytes32_t
State::get_storage(Address const &address, bytes32_t const &key) const
{
    auto const account = storage_.find(address);
    if (account == storage_.end()) {
        return {};
    }
    auto const slot = account->second.find(key);
    if (slot == account->second.end()) {
        return {};
    }
    return slot->second;
}

void State::set_storage(
    Address const &address, bytes32_t const &key, bytes32_t const &value)
{
    if (!checkpoints_.empty()) {
        auto &original = checkpoints_.back().original[address];
        if (!original.contains(key)) {
            original.emplace(key, get_storage(address, key));
        }
    }
    write(address, key, value);
}

std::vector<std::pair<bytes32_t, bytes32_t>>
State::get_storage_slots(Address const &address) const
{
    std::vector<std::pair<bytes32_t, bytes32_t>> slots;
    auto const account = storage_.find(address);
    if (account != storage_.end()) {
        slots.assign(account->second.begin(), account->second.end());
    }
    std::ranges::sort(slots, [](auto const &a, auto const &b) {
        return std::memcmp(a.first.bytes, b.first.bytes, sizeof(bytes32_t)) <
               0;
    });
    return slots;
}

void State::store_log(Receipt::Log const &log)
{
    logs_.push_back(log);
}

std::vector<Receipt::Log> const &State::logs() const
{
    return logs_;
}

void State::push()
{
    checkpoints_.push_back(Checkpoint{.original = {}, .num_logs = logs_.size()});
}

void State::pop_accept()
{
    VAULTBOOST_ASSERT(!checkpoints_.empty());

    auto checkpoint = std::move(checkpoints_.back());
    checkpoints_.pop_back();
    if (checkpoints_.empty()) {
        return;
    }

    // the enclosing checkpoint keeps its own original value when it has one
    auto &parent = checkpoints_.back().original;
    for (auto &[address, slots] : checkpoint.original) {
        auto &parent_slots = parent[address];
        for (auto const &[key, value] : slots) {
            parent_slots.try_emplace(key, value);
        }
    }
}

void State::pop_reject()
{
    VAULTBOOST_ASSERT(!checkpoints_.empty());

    auto const checkpoint = std::move(checkpoints_.back());
    checkpoints_.pop_back();
    for (auto const &[address, slots] : checkpoint.original) {
        for (auto const &[key, value] : slots) {
            write(address, key, value);
        }
    }
    VAULTBOOST_ASSERT(checkpoint.num_logs <= logs_.size());
    logs_.resize(checkpoint.num_logs);
}

size_t State::depth() const noexcept
{
    return checkpoints_.size();
}

VAULTBOOST_NAMESPACE_END
