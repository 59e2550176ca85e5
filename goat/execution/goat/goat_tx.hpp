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
#include <goat/core/result.hpp>
#include <goat/execution/core/address.hpp>
#include <goat/execution/goat/goat_types.hpp>
#include <goat/execution/goat/tx_bridge.hpp>
#include <goat/execution/goat/tx_locking.hpp>

#include <optional>
#include <variant>

GOAT_NAMESPACE_BEGIN

using GoatTxInner = std::variant<
    NewBtcBlockTx, Cancel2Tx, PaidTx, DepositTx, CompleteUnlockTx,
    DistributeRewardTx>;

/// Decodes a payload according to the (module, action) route. Fails with
/// UnknownModule or UnknownAction when no route exists, otherwise with the
/// selected variant's decode error.
Result<GoatTxInner>
decode_goat_tx(Module, Action, byte_string_view payload);

byte_string encode_goat_tx(GoatTxInner const &);

Address sender(GoatTxInner const &);
Address destination(GoatTxInner const &);
std::optional<Mint> deposit(GoatTxInner const &);
std::optional<Mint> withdraw(GoatTxInner const &);

GOAT_NAMESPACE_END
