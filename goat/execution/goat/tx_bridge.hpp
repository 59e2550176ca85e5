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
#include <goat/core/bytes.hpp>
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

/// Relayer announcing a new bitcoin block hash
struct NewBtcBlockTx
{
    static constexpr uint32_t SELECTOR =
        abi_encode_selector("newBlockHash(bytes32)");
    static constexpr size_t SIZE = 36;

    bytes32_t hash{};

    static Result<NewBtcBlockTx> decode(byte_string_view);
    byte_string encode() const;

    constexpr Address sender() const
    {
        return RELAYER_EXECUTOR;
    }

    constexpr Address contract() const
    {
        return BITCOIN_CONTRACT;
    }

    std::optional<Mint> deposit() const
    {
        return std::nullopt;
    }

    std::optional<Mint> withdraw() const
    {
        return std::nullopt;
    }

    friend bool operator==(NewBtcBlockTx const &, NewBtcBlockTx const &) =
        default;
};

/// Relayer cancelling a pending withdrawal
struct Cancel2Tx
{
    static constexpr uint32_t SELECTOR =
        abi_encode_selector("cancel2(uint256)");
    static constexpr size_t SIZE = 36;

    uint256_t id{};

    static Result<Cancel2Tx> decode(byte_string_view);
    byte_string encode() const;

    constexpr Address sender() const
    {
        return RELAYER_EXECUTOR;
    }

    constexpr Address contract() const
    {
        return BRIDGE_CONTRACT;
    }

    std::optional<Mint> deposit() const
    {
        return std::nullopt;
    }

    std::optional<Mint> withdraw() const
    {
        return std::nullopt;
    }

    friend bool operator==(Cancel2Tx const &, Cancel2Tx const &) = default;
};

/// Relayer reporting that a withdrawal was paid out on bitcoin
struct PaidTx
{
    static constexpr uint32_t SELECTOR =
        abi_encode_selector("paid(uint256,bytes32,uint32,uint256)");
    static constexpr size_t SIZE = 132;

    uint256_t id{};
    bytes32_t tx_id{};
    uint32_t tx_out{};
    uint256_t amount{};

    static Result<PaidTx> decode(byte_string_view);
    byte_string encode() const;

    constexpr Address sender() const
    {
        return RELAYER_EXECUTOR;
    }

    constexpr Address contract() const
    {
        return BRIDGE_CONTRACT;
    }

    std::optional<Mint> deposit() const
    {
        return std::nullopt;
    }

    std::optional<Mint> withdraw() const
    {
        return std::nullopt;
    }

    friend bool operator==(PaidTx const &, PaidTx const &) = default;
};

/// Relayer crediting a confirmed bitcoin deposit
struct DepositTx
{
    static constexpr uint32_t SELECTOR = abi_encode_selector(
        "deposit(bytes32,uint32,address,uint256,uint256)");
    static constexpr size_t SIZE = 164;

    bytes32_t tx_id{};
    uint32_t tx_out{};
    Address target{};
    uint256_t amount{};
    uint256_t tax{};

    static Result<DepositTx> decode(byte_string_view);
    byte_string encode() const;

    constexpr Address sender() const
    {
        return RELAYER_EXECUTOR;
    }

    constexpr Address contract() const
    {
        return BRIDGE_CONTRACT;
    }

    std::optional<Mint> deposit() const
    {
        return Mint{.address = target, .amount = amount, .tax = tax};
    }

    std::optional<Mint> withdraw() const
    {
        return std::nullopt;
    }

    friend bool operator==(DepositTx const &, DepositTx const &) = default;
};

static_assert(NewBtcBlockTx::SELECTOR == 0x94f490bd);
static_assert(Cancel2Tx::SELECTOR == 0xc19dd320);
static_assert(PaidTx::SELECTOR == 0xb670ab5e);
static_assert(DepositTx::SELECTOR == 0x904183cb);

GOAT_NAMESPACE_END
