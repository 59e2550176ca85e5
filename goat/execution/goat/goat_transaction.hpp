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
#include <goat/execution/goat/chain/goat_chain.hpp>
#include <goat/execution/goat/goat_tx.hpp>
#include <goat/execution/goat/goat_types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

GOAT_NAMESPACE_BEGIN

/**
 * System transaction envelope. The payload is decoded explicitly and once by
 * decode_inner(), which the RLP decoder calls eagerly. Accessors that depend
 * on the inner transaction assert that the envelope is parsed; they never
 * decode.
 *
 * chain_id defaults to the mainnet id. Use make_goat_transaction() to build
 * an envelope for another chain.
 *
 * Goat transactions are unsigned and fee-free, so the fee accessors report
 * zero and there is no access list, blob or authorization data.
 */
struct GoatTransaction
{
    Module module{};
    Action action{};
    uint64_t nonce{};
    byte_string input{};
    uint64_t chain_id{GOAT_MAINNET_CHAIN_ID};
    std::optional<GoatTxInner> inner{};

    Result<void> decode_inner();

    bool is_parsed() const
    {
        return inner.has_value();
    }

    GoatTxInner const &get_inner() const;

    Address sender() const;
    Address destination() const;
    std::optional<Mint> deposit() const;
    std::optional<Mint> withdraw() const;

    Address caller() const
    {
        return sender();
    }

    size_t size() const
    {
        return sizeof(Module) + sizeof(Action) + sizeof(uint64_t) +
               input.size();
    }

    void set_chain_id(uint64_t const id)
    {
        chain_id = id;
    }

    static constexpr uint8_t type()
    {
        return GOAT_TX_TYPE;
    }

    static constexpr bool is_goat_tx()
    {
        return true;
    }

    static constexpr bool is_dynamic_fee()
    {
        return false;
    }

    static constexpr bool is_create()
    {
        return false;
    }

    static constexpr uint64_t gas_limit()
    {
        return 0;
    }

    static constexpr uint256_t value()
    {
        return 0;
    }

    static constexpr uint256_t gas_price()
    {
        return 0;
    }

    static constexpr uint256_t max_fee_per_gas()
    {
        return 0;
    }

    static constexpr uint256_t max_priority_fee_per_gas()
    {
        return 0;
    }

    static constexpr uint256_t max_fee_per_blob_gas()
    {
        return 0;
    }

    static constexpr uint256_t
    priority_fee_or_price(uint256_t const & /* base_fee_per_gas */)
    {
        return 0;
    }

    static constexpr uint256_t
    effective_gas_price(uint256_t const & /* base_fee_per_gas */)
    {
        return 0;
    }

    static constexpr bool has_access_list()
    {
        return false;
    }

    static constexpr bool has_authorization_list()
    {
        return false;
    }

    static std::optional<std::vector<bytes32_t>> blob_versioned_hashes()
    {
        return std::nullopt;
    }

    friend bool
    operator==(GoatTransaction const &, GoatTransaction const &) = default;
};

GoatTransaction make_goat_transaction(
    GoatChain const &, Module, Action, uint64_t nonce, byte_string input);

GOAT_NAMESPACE_END
