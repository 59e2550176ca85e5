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

#include <goat/core/assert.h>
#include <goat/core/config.hpp>
#include <goat/core/result.hpp>
#include <goat/execution/core/address.hpp>
#include <goat/execution/goat/chain/goat_chain.hpp>
#include <goat/execution/goat/goat_transaction.hpp>
#include <goat/execution/goat/goat_tx.hpp>

#include <boost/outcome/config.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <cstdint>
#include <optional>
#include <utility>

GOAT_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

Result<void> GoatTransaction::decode_inner()
{
    if (inner.has_value()) {
        return success();
    }
    BOOST_OUTCOME_TRY(auto tx, decode_goat_tx(module, action, input));
    inner.emplace(std::move(tx));
    return success();
}

GoatTxInner const &GoatTransaction::get_inner() const
{
    GOAT_ASSERT(inner.has_value());
    return *inner;
}

Address GoatTransaction::sender() const
{
    return goat::sender(get_inner());
}

Address GoatTransaction::destination() const
{
    return goat::destination(get_inner());
}

std::optional<Mint> GoatTransaction::deposit() const
{
    return goat::deposit(get_inner());
}

std::optional<Mint> GoatTransaction::withdraw() const
{
    return goat::withdraw(get_inner());
}

GoatTransaction make_goat_transaction(
    GoatChain const &chain, Module const module, Action const action,
    uint64_t const nonce, byte_string input)
{
    return GoatTransaction{
        .module = module,
        .action = action,
        .nonce = nonce,
        .input = std::move(input),
        .chain_id = chain.get_chain_id()};
}

GOAT_NAMESPACE_END
