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

#include <goat/core/byte_string.hpp>
#include <goat/core/config.hpp>
#include <goat/core/int.hpp>
#include <goat/core/result.hpp>
#include <goat/execution/core/address.hpp>
#include <goat/execution/core/contract/abi_signatures.hpp>
#include <goat/execution/goat/goat_types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

GOAT_NAMESPACE_BEGIN

/// Locking executor releasing an unlocked stake to its owner. Only the
/// native token leaves through the consensus layer; other tokens are
/// settled by the locking contract itself.
struct CompleteUnlockTx
{
    static constexpr uint32_t SELECTOR = abi_encode_selector(
        "completeUnlock(uint64,address,address,uint256)");
    static constexpr size_t SIZE = 132;

    uint64_t id{};
    Address recipient{};
    Address token{};
    uint256_t amount{};

    static Result<CompleteUnlockTx> decode(byte_string_view);
    byte_string encode() const;

    constexpr Address sender() const
    {
        return LOCKING_EXECUTOR;
    }

    constexpr Address contract() const
    {
        return LOCKING_CONTRACT;
    }

    std::optional<Mint> deposit() const
    {
        return std::nullopt;
    }

    std::optional<Mint> withdraw() const;

    friend bool
    operator==(CompleteUnlockTx const &, CompleteUnlockTx const &) = default;
};

/// Locking executor paying out validator rewards
struct DistributeRewardTx
{
    static constexpr uint32_t SELECTOR = abi_encode_selector(
        "distributeReward(uint64,address,uint256,uint256)");
    static constexpr size_t SIZE = 132;

    uint64_t id{};
    Address recipient{};
    uint256_t goat{};
    uint256_t gas_reward{};

    static Result<DistributeRewardTx> decode(byte_string_view);
    byte_string encode() const;

    constexpr Address sender() const
    {
        return LOCKING_EXECUTOR;
    }

    constexpr Address contract() const
    {
        return LOCKING_CONTRACT;
    }

    std::optional<Mint> deposit() const
    {
        return std::nullopt;
    }

    // only the gas reward is paid in the native token
    std::optional<Mint> withdraw() const
    {
        return Mint{.address = recipient, .amount = gas_reward, .tax = 0};
    }

    friend bool
    operator==(DistributeRewardTx const &, DistributeRewardTx const &) =
        default;
};

static_assert(CompleteUnlockTx::SELECTOR == 0x00aba51a);
static_assert(DistributeRewardTx::SELECTOR == 0xbd9fadb5);

GOAT_NAMESPACE_END
