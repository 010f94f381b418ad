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
#include <vaultboost/core/int.hpp>
#include <vaultboost/core/result.hpp>
#include <vaultboost/execution/core/address.hpp>
#include <vaultboost/execution/hooks/constants.hpp>
#include <vaultboost/execution/hooks/prize_pool_client.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook.hpp>
#include <vaultboost/execution/hooks/vault_boost_hook_error.hpp>
#include <vaultboost/execution/state/state.hpp>

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/outcome/success_failure.hpp>
#include <fuzzer/FuzzedDataProvider.h>
#include <intx/intx.hpp>

#include <quill/Quill.h>

using namespace vaultboost;

namespace
{
    constexpr auto HOOK_CA{0x0000000000000000000000000000000000001000_address};
    constexpr auto PRIZE_POOL{
        0x9999999999999999999999999999999999999999_address};

    // small address space so boosters collide with vaults and the pool
    Address consume_address(FuzzedDataProvider &provider)
    {
        switch (provider.ConsumeIntegralInRange<unsigned>(0, 5)) {
        case 0:
            return Address{};
        case 1:
            return PRIZE_POOL;
        case 2:
            return HOOK_CA;
        default:
            return Address{provider.ConsumeIntegralInRange<uint64_t>(1, 8)};
        }
    }

    uint256_t consume_u256(FuzzedDataProvider &provider)
    {
        auto const bytes = provider.ConsumeBytes<uint8_t>(32); // may be shorter
        uint256_t x = 0;
        for (uint8_t const c : bytes) {
            x = (x << 8) | c;
        }
        return x;
    }

    class FuzzPrizePool final : public PrizePoolClient
    {
    public:
        uint8_t tiers{0};
        bool fail{false};
        std::vector<std::pair<Address, uint256_t>> contributions;

        Result<uint8_t> number_of_tiers(Address const &prize_pool) override
        {
            VAULTBOOST_ASSERT(prize_pool == PRIZE_POOL);
            if (fail) {
                return VaultBoostHookError::PrizePoolCallFailed;
            }
            return tiers;
        }

        Result<void> contribute_prize_tokens(
            Address const &prize_pool, Address const &beneficiary,
            uint256_t const &amount) override
        {
            VAULTBOOST_ASSERT(prize_pool == PRIZE_POOL);
            if (fail) {
                return VaultBoostHookError::PrizePoolCallFailed;
            }
            contributions.emplace_back(beneficiary, amount);
            return outcome::success();
        }
    };

    // In memory model of the hook, written directly from its rules
    class HookOracle
    {
        std::unordered_map<Address, Address> beneficiaries_;

    public:
        Address beneficiary(Address const &booster) const
        {
            auto const it = beneficiaries_.find(booster);
            return it == beneficiaries_.end() ? Address{} : it->second;
        }

        void set_beneficiary(Address const &booster, Address const &vault)
        {
            beneficiaries_[booster] = vault;
        }

        std::optional<Address> before_claim_prize(
            Address const &winner, unsigned const tier,
            unsigned const tiers) const
        {
            if (beneficiary(winner) == Address{}) {
                return winner;
            }
            if (tiers < NUMBER_OF_CANARY_TIERS + 1u) {
                return std::nullopt;
            }
            return tier + NUMBER_OF_CANARY_TIERS + 1u >= tiers ? PRIZE_POOL
                                                               : winner;
        }

        bool boosts(Address const &recipient, uint256_t const &prize) const
        {
            return recipient == PRIZE_POOL && prize != 0;
        }
    };
}

extern "C" int LLVMFuzzerTestOneInput(uint8_t const *input, size_t const size)
{
    quill::start(false);
    quill::get_root_logger()->set_log_level(quill::LogLevel::Error);

    FuzzedDataProvider provider{input, size};

    State state;
    FuzzPrizePool prize_pool;
    HookOracle oracle;
    VaultBoostHook hook{state, HOOK_CA, prize_pool};
    VAULTBOOST_ASSERT(
        !VaultBoostHook::deploy(state, HOOK_CA, PRIZE_POOL).has_error());

    enum UserTransaction : uint32_t
    {
        SET_BENEFICIARY = 0,
        BEFORE_CLAIM_PRIZE,
        AFTER_CLAIM_PRIZE,
        kMaxValue, /* For the fuzzed data provider */
    };

    while (provider.remaining_bytes() > 0) {
        auto const booster = consume_address(provider);
        prize_pool.fail = provider.ConsumeProbability<float>() < 0.1f;
        auto const num_logs = state.logs().size();
        auto const num_contributions = prize_pool.contributions.size();

        state.push();
        bool success = true;
        switch (provider.ConsumeEnum<UserTransaction>()) {
        case SET_BENEFICIARY: {
            auto const vault = consume_address(provider);
            hook.set_beneficiary(booster, vault);
            oracle.set_beneficiary(booster, vault);
            VAULTBOOST_ASSERT(state.logs().size() == num_logs + 1);
        } break;
        case BEFORE_CLAIM_PRIZE: {
            prize_pool.tiers = provider.ConsumeIntegral<uint8_t>();
            auto const tier = provider.ConsumeIntegral<uint8_t>();
            auto const res = hook.before_claim_prize(booster, tier);
            auto const expected =
                oracle.before_claim_prize(booster, tier, prize_pool.tiers);
            bool const pool_queried =
                oracle.beneficiary(booster) != Address{};
            if (pool_queried && prize_pool.fail) {
                VAULTBOOST_ASSERT(
                    res.has_error() &&
                    res.error() == VaultBoostHookError::PrizePoolCallFailed);
            }
            else if (!expected.has_value()) {
                VAULTBOOST_ASSERT(
                    res.has_error() &&
                    res.error() ==
                        VaultBoostHookError::InvalidTierConfiguration);
            }
            else {
                VAULTBOOST_ASSERT(
                    res.has_value() && res.value() == expected.value());
            }
            success = res.has_value();
            VAULTBOOST_ASSERT(state.logs().size() == num_logs);
        } break;
        case AFTER_CLAIM_PRIZE: {
            auto const recipient = provider.ConsumeBool()
                                       ? PRIZE_POOL
                                       : consume_address(provider);
            auto const prize = consume_u256(provider);
            auto const res = hook.after_claim_prize(booster, prize, recipient);
            if (!oracle.boosts(recipient, prize)) {
                VAULTBOOST_ASSERT(!res.has_error());
                VAULTBOOST_ASSERT(
                    prize_pool.contributions.size() == num_contributions);
                VAULTBOOST_ASSERT(state.logs().size() == num_logs);
            }
            else if (prize_pool.fail) {
                VAULTBOOST_ASSERT(
                    res.has_error() &&
                    res.error() == VaultBoostHookError::PrizePoolCallFailed);
            }
            else {
                VAULTBOOST_ASSERT(!res.has_error());
                VAULTBOOST_ASSERT(
                    prize_pool.contributions.size() == num_contributions + 1);
                VAULTBOOST_ASSERT(
                    prize_pool.contributions.back() ==
                    std::make_pair(oracle.beneficiary(booster), prize));
                VAULTBOOST_ASSERT(state.logs().size() == num_logs + 1);
            }
            success = !res.has_error();
        } break;
        default:
            break;
        }

        if (success) {
            state.pop_accept();
        }
        else {
            state.pop_reject();
            VAULTBOOST_ASSERT(state.logs().size() == num_logs);
        }

        VAULTBOOST_ASSERT(hook.vault_beneficiary(booster) ==
                          oracle.beneficiary(booster));
        VAULTBOOST_ASSERT(hook.prize_pool().value() == PRIZE_POOL);
    }

    quill::flush();

    return 0;
}
