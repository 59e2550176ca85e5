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

#include <goat/core/byte_string.hpp>
#include <goat/core/config.hpp>
#include <goat/core/result.hpp>
#include <goat/execution/core/contract/abi_encode.hpp>
#include <goat/execution/core/contract/big_endian.hpp>
#include <goat/execution/goat/calldata.hpp>
#include <goat/execution/goat/goat_types.hpp>
#include <goat/execution/goat/tx_locking.hpp>

#include <boost/outcome/try.hpp>

#include <optional>

GOAT_NAMESPACE_BEGIN

Result<CompleteUnlockTx> CompleteUnlockTx::decode(byte_string_view const input)
{
    BOOST_OUTCOME_TRY(
        auto reader,
        CalldataReader::open(input, SIZE, SELECTOR, "completeUnlock"));

    CompleteUnlockTx tx;
    BOOST_OUTCOME_TRY(tx.id, reader.read_uint64());
    BOOST_OUTCOME_TRY(tx.recipient, reader.read_address());
    BOOST_OUTCOME_TRY(tx.token, reader.read_address());
    BOOST_OUTCOME_TRY(tx.amount, reader.read_uint256());
    return tx;
}

byte_string CompleteUnlockTx::encode() const
{
    return encode_calldata(
        SELECTOR,
        {abi_encode_uint(u64_be{id}),
         abi_encode_address(recipient),
         abi_encode_address(token),
         abi_encode_uint(u256_be{amount})});
}

std::optional<Mint> CompleteUnlockTx::withdraw() const
{
    if (token != NATIVE_TOKEN) {
        return std::nullopt;
    }
    return Mint{.address = recipient, .amount = amount, .tax = 0};
}

Result<DistributeRewardTx>
DistributeRewardTx::decode(byte_string_view const input)
{
    BOOST_OUTCOME_TRY(
        auto reader,
        CalldataReader::open(input, SIZE, SELECTOR, "distributeReward"));

    DistributeRewardTx tx;
    BOOST_OUTCOME_TRY(tx.id, reader.read_uint64());
    BOOST_OUTCOME_TRY(tx.recipient, reader.read_address());
    BOOST_OUTCOME_TRY(tx.goat, reader.read_uint256());
    BOOST_OUTCOME_TRY(tx.gas_reward, reader.read_uint256());
    return tx;
}

byte_string DistributeRewardTx::encode() const
{
    return encode_calldata(
        SELECTOR,
        {abi_encode_uint(u64_be{id}),
         abi_encode_address(recipient),
         abi_encode_uint(u256_be{goat}),
         abi_encode_uint(u256_be{gas_reward})});
}

GOAT_NAMESPACE_END
