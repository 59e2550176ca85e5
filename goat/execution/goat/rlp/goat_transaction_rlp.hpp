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
#include <goat/core/result.hpp>
#include <goat/core/rlp/config.hpp>
#include <goat/execution/goat/chain/goat_chain.hpp>
#include <goat/execution/goat/goat_transaction.hpp>

#include <cstddef>

GOAT_RLP_NAMESPACE_BEGIN

byte_string encode_goat_transaction(GoatTransaction const &);
byte_string encode_goat_transaction_typed(GoatTransaction const &);
byte_string encode_goat_transaction_for_signing(GoatTransaction const &);
size_t signing_payload_length(GoatTransaction const &);

/**
 * decodes the untyped [module, action, nonce, input] list, stamps the chain
 * id and resolves the inner transaction
 */
Result<GoatTransaction>
decode_goat_transaction(byte_string_view &, GoatChain const &);

Result<GoatTransaction>
decode_goat_transaction_typed(byte_string_view &, GoatChain const &);

GOAT_RLP_NAMESPACE_END
