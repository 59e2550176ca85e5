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

#include <goat/core/config.hpp>
#include <goat/core/int.hpp>
#include <goat/execution/core/address.hpp>

#include <cstdint>

GOAT_NAMESPACE_BEGIN

using Module = uint8_t;
using Action = uint8_t;

namespace modules
{
    inline constexpr Module BRIDGE = 1;
    inline constexpr Module LOCKING = 2;
}

namespace bridge_action
{
    inline constexpr Action DEPOSIT = 1;
    inline constexpr Action CANCEL2 = 2;
    inline constexpr Action PAID = 3;
    inline constexpr Action BITCOIN_NEW_BLOCK = 4;
}

namespace locking_action
{
    inline constexpr Action COMPLETE_UNLOCK = 1;
    inline constexpr Action DISTRIBUTE_REWARD = 2;
}

// EIP-2718 type byte; prefixes the signing payload, never the RLP list
inline constexpr uint8_t GOAT_TX_TYPE = 0x60;

inline constexpr uint64_t GOAT_MAINNET_CHAIN_ID = 2345;
inline constexpr uint64_t GOAT_TESTNET_CHAIN_ID = 48816;

using namespace evmc::literals;

// predeployed system contracts
inline constexpr Address BRIDGE_CONTRACT{
    0xbc10000000000000000000000000000000000003_address};
inline constexpr Address LOCKING_CONTRACT{
    0xbc10000000000000000000000000000000000004_address};
inline constexpr Address BITCOIN_CONTRACT{
    0xbc10000000000000000000000000000000000005_address};

// off-chain roles that are the logical senders of goat transactions
inline constexpr Address RELAYER_EXECUTOR{
    0xbc10000000000000000000000000000000001000_address};
inline constexpr Address LOCKING_EXECUTOR{
    0xbc10000000000000000000000000000000001001_address};

inline constexpr Address NATIVE_TOKEN{};

/// Value crossing the chain boundary: credited to address on deposit,
/// released to it on withdraw. Tax is settled by the caller.
struct Mint
{
    Address address{};
    uint256_t amount{};
    uint256_t tax{};

    friend bool operator==(Mint const &, Mint const &) = default;
};

GOAT_NAMESPACE_END
