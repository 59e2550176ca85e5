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
#include <goat/core/bytes.hpp>
#include <goat/core/config.hpp>
#include <goat/core/result.hpp>
#include <goat/execution/core/contract/abi_encode.hpp>
#include <goat/execution/core/contract/big_endian.hpp>
#include <goat/execution/goat/calldata.hpp>
#include <goat/execution/goat/tx_bridge.hpp>

#include <boost/outcome/try.hpp>

GOAT_NAMESPACE_BEGIN

Result<NewBtcBlockTx> NewBtcBlockTx::decode(byte_string_view const input)
{
    BOOST_OUTCOME_TRY(
        auto reader,
        CalldataReader::open(input, SIZE, SELECTOR, "newBlockHash"));

    NewBtcBlockTx tx;
    BOOST_OUTCOME_TRY(tx.hash, reader.read_bytes32());
    return tx;
}

byte_string NewBtcBlockTx::encode() const
{
    return encode_calldata(SELECTOR, {hash});
}

Result<Cancel2Tx> Cancel2Tx::decode(byte_string_view const input)
{
    BOOST_OUTCOME_TRY(
        auto reader, CalldataReader::open(input, SIZE, SELECTOR, "cancel2"));

    Cancel2Tx tx;
    BOOST_OUTCOME_TRY(tx.id, reader.read_uint256());
    return tx;
}

byte_string Cancel2Tx::encode() const
{
    return encode_calldata(SELECTOR, {abi_encode_uint(u256_be{id})});
}

Result<PaidTx> PaidTx::decode(byte_string_view const input)
{
    BOOST_OUTCOME_TRY(
        auto reader, CalldataReader::open(input, SIZE, SELECTOR, "paid"));

    PaidTx tx;
    BOOST_OUTCOME_TRY(tx.id, reader.read_uint256());
    BOOST_OUTCOME_TRY(tx.tx_id, reader.read_bytes32());
    BOOST_OUTCOME_TRY(tx.tx_out, reader.read_uint32());
    BOOST_OUTCOME_TRY(tx.amount, reader.read_uint256());
    return tx;
}

byte_string PaidTx::encode() const
{
    return encode_calldata(
        SELECTOR,
        {abi_encode_uint(u256_be{id}),
         tx_id,
         abi_encode_uint(u32_be{tx_out}),
         abi_encode_uint(u256_be{amount})});
}

Result<DepositTx> DepositTx::decode(byte_string_view const input)
{
    BOOST_OUTCOME_TRY(
        auto reader, CalldataReader::open(input, SIZE, SELECTOR, "deposit"));

    DepositTx tx;
    BOOST_OUTCOME_TRY(tx.tx_id, reader.read_bytes32());
    BOOST_OUTCOME_TRY(tx.tx_out, reader.read_uint32());
    BOOST_OUTCOME_TRY(tx.target, reader.read_address());
    BOOST_OUTCOME_TRY(tx.amount, reader.read_uint256());
    BOOST_OUTCOME_TRY(tx.tax, reader.read_uint256());
    return tx;
}

byte_string DepositTx::encode() const
{
    return encode_calldata(
        SELECTOR,
        {tx_id,
         abi_encode_uint(u32_be{tx_out}),
         abi_encode_address(target),
         abi_encode_uint(u256_be{amount}),
         abi_encode_uint(u256_be{tax})});
}

GOAT_NAMESPACE_END
