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
#include <goat/core/likely.h>
#include <goat/core/result.hpp>
#include <goat/core/rlp/config.hpp>
#include <goat/execution/goat/chain/goat_chain.hpp>
#include <goat/execution/goat/goat_transaction.hpp>
#include <goat/execution/goat/goat_types.hpp>
#include <goat/execution/goat/rlp/goat_transaction_rlp.hpp>
#include <goat/execution/rlp/decode.hpp>
#include <goat/execution/rlp/decode_error.hpp>
#include <goat/execution/rlp/encode.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>

GOAT_RLP_NAMESPACE_BEGIN

byte_string encode_goat_transaction(GoatTransaction const &tx)
{
    return encode_list2(
        encode_unsigned(tx.module),
        encode_unsigned(tx.action),
        encode_unsigned(tx.nonce),
        encode_string2(tx.input));
}

byte_string encode_goat_transaction_typed(GoatTransaction const &tx)
{
    auto const prefix = byte_string(1, GoatTransaction::type());
    return prefix + encode_goat_transaction(tx);
}

byte_string encode_goat_transaction_for_signing(GoatTransaction const &tx)
{
    return encode_goat_transaction_typed(tx);
}

size_t signing_payload_length(GoatTransaction const &tx)
{
    return encode_goat_transaction(tx).size() + 1;
}

Result<GoatTransaction>
decode_goat_transaction(byte_string_view &enc, GoatChain const &chain)
{
    GoatTransaction tx;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    BOOST_OUTCOME_TRY(tx.module, decode_unsigned<Module>(payload));
    BOOST_OUTCOME_TRY(tx.action, decode_unsigned<Action>(payload));
    BOOST_OUTCOME_TRY(tx.nonce, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(auto const input, decode_string(payload));
    tx.input = input;

    if (GOAT_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    tx.set_chain_id(chain.get_chain_id());
    BOOST_OUTCOME_TRY(tx.decode_inner());

    LOG_DEBUG(
        "decoded goat tx module={} action={} nonce={}",
        tx.module,
        tx.action,
        tx.nonce);
    return tx;
}

Result<GoatTransaction>
decode_goat_transaction_typed(byte_string_view &enc, GoatChain const &chain)
{
    if (GOAT_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }
    if (GOAT_UNLIKELY(enc[0] != GOAT_TX_TYPE)) {
        return DecodeError::InvalidTxnType;
    }
    enc = enc.substr(1);
    return decode_goat_transaction(enc, chain);
}

GOAT_RLP_NAMESPACE_END
