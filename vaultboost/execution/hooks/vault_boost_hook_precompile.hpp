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
#include <vaultboost/execution/core/address.hpp>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>

#include <optional>

VAULTBOOST_NAMESPACE_BEGIN

class State;

// Executes `msg` natively when it is addressed to the hook deployed at
// `hook_address`. Returns std::nullopt for any other code address. Calls made
// by the hook into the prize pool go through `host`.
std::optional<evmc::Result> check_call_vault_boost_hook(
    State &, evmc::HostInterface &host, Address const &hook_address,
    evmc_message const &msg);

VAULTBOOST_NAMESPACE_END
