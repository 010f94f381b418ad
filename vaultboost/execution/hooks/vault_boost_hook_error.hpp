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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

VAULTBOOST_NAMESPACE_BEGIN

enum class VaultBoostHookError
{
    Success = 0,
    MethodNotSupported,
    InvalidInput,
    ValueNonZero,
    StaticCallNotAllowed,
    PrizePoolAddressZero,
    AlreadyDeployed,
    NotDeployed,
    InvalidTierConfiguration,
    PrizePoolCallFailed,
    InvalidConfig,
    GenesisWriteFailed,
};

VAULTBOOST_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<vaultboost::VaultBoostHookError>
    : quick_status_code_from_enum_defaults<vaultboost::VaultBoostHookError>
{
    static constexpr auto const domain_name = "Vault Boost Hook Error";
    static constexpr auto const domain_uuid =
        "a3f1c2d4-5e6b-4c7d-8e9f-0a1b2c3d4e5f";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
