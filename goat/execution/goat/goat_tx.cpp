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
#include <goat/core/likely.h>
#include <goat/core/result.hpp>
#include <goat/execution/core/address.hpp>
#include <goat/execution/goat/goat_error.hpp>
#include <goat/execution/goat/goat_tx.hpp>
#include <goat/execution/goat/goat_types.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <optional>
#include <variant>

GOAT_ANONYMOUS_NAMESPACE_BEGIN

template <typename Tx>
Result<GoatTxInner> decode_as(byte_string_view const payload)
{
    BOOST_OUTCOME_TRY(auto tx, Tx::decode(payload));
    return GoatTxInner{std::move(tx)};
}

Result<GoatTxInner>
decode_bridge_tx(Action const action, byte_string_view const payload)
{
    switch (action) {
    case bridge_action::DEPOSIT:
        return decode_as<DepositTx>(payload);
    case bridge_action::CANCEL2:
        return decode_as<Cancel2Tx>(payload);
    case bridge_action::PAID:
        return decode_as<PaidTx>(payload);
    case bridge_action::BITCOIN_NEW_BLOCK:
        return decode_as<NewBtcBlockTx>(payload);
    default:
        LOG_DEBUG("unknown action {} for bridge module", action);
        return GoatTxError::UnknownAction;
    }
}

Result<GoatTxInner>
decode_locking_tx(Action const action, byte_string_view const payload)
{
    switch (action) {
    case locking_action::COMPLETE_UNLOCK:
        return decode_as<CompleteUnlockTx>(payload);
    case locking_action::DISTRIBUTE_REWARD:
        return decode_as<DistributeRewardTx>(payload);
    default:
        LOG_DEBUG("unknown action {} for locking module", action);
        return GoatTxError::UnknownAction;
    }
}

GOAT_ANONYMOUS_NAMESPACE_END

GOAT_NAMESPACE_BEGIN

Result<GoatTxInner> decode_goat_tx(
    Module const module, Action const action, byte_string_view const payload)
{
    switch (module) {
    case modules::BRIDGE:
        return decode_bridge_tx(action, payload);
    case modules::LOCKING:
        return decode_locking_tx(action, payload);
    default:
        LOG_DEBUG("unknown module {} for goat tx", module);
        return GoatTxError::UnknownModule;
    }
}

byte_string encode_goat_tx(GoatTxInner const &inner)
{
    return std::visit([](auto const &tx) { return tx.encode(); }, inner);
}

Address sender(GoatTxInner const &inner)
{
    return std::visit([](auto const &tx) { return tx.sender(); }, inner);
}

Address destination(GoatTxInner const &inner)
{
    return std::visit([](auto const &tx) { return tx.contract(); }, inner);
}

std::optional<Mint> deposit(GoatTxInner const &inner)
{
    return std::visit([](auto const &tx) { return tx.deposit(); }, inner);
}

std::optional<Mint> withdraw(GoatTxInner const &inner)
{
    return std::visit([](auto const &tx) { return tx.withdraw(); }, inner);
}

GOAT_NAMESPACE_END
