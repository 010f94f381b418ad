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

#include <cstdint>

VAULTBOOST_NAMESPACE_BEGIN

// Canary tiers sit at the top of the tier range. The daily prize tier is the
// last ordinary tier below them.
inline constexpr uint8_t NUMBER_OF_CANARY_TIERS = 2;

// Gas forwarded with each call into the prize pool
inline constexpr int64_t PRIZE_POOL_VIEW_CALL_GAS = 30'000;
inline constexpr int64_t PRIZE_POOL_CONTRIBUTE_CALL_GAS = 150'000;

VAULTBOOST_NAMESPACE_END
