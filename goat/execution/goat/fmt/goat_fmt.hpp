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

#include <goat/core/basic_formatter.hpp>
#include <goat/execution/core/fmt/address_fmt.hpp>
#include <goat/execution/core/fmt/bytes_fmt.hpp>
#include <goat/execution/core/fmt/int_fmt.hpp>
#include <goat/execution/goat/goat_transaction.hpp>
#include <goat/execution/goat/goat_tx.hpp>
#include <goat/execution/goat/goat_types.hpp>
#include <goat/execution/goat/tx_bridge.hpp>
#include <goat/execution/goat/tx_locking.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <span>
#include <variant>

template <>
struct quill::copy_loggable<goat::Mint> : std::true_type
{
};

template <>
struct quill::copy_loggable<goat::NewBtcBlockTx> : std::true_type
{
};

template <>
struct quill::copy_loggable<goat::Cancel2Tx> : std::true_type
{
};

template <>
struct quill::copy_loggable<goat::PaidTx> : std::true_type
{
};

template <>
struct quill::copy_loggable<goat::DepositTx> : std::true_type
{
};

template <>
struct quill::copy_loggable<goat::CompleteUnlockTx> : std::true_type
{
};

template <>
struct quill::copy_loggable<goat::DistributeRewardTx> : std::true_type
{
};

template <>
struct quill::copy_loggable<goat::GoatTxInner> : std::true_type
{
};

template <>
struct quill::copy_loggable<goat::GoatTransaction> : std::true_type
{
};

template <>
struct fmt::formatter<goat::Mint> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::Mint const &m, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Mint{{address={} amount={} tax={}}}",
            m.address,
            m.amount,
            m.tax);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<goat::NewBtcBlockTx> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::NewBtcBlockTx const &tx, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "NewBtcBlock{{hash={}}}", tx.hash);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<goat::Cancel2Tx> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::Cancel2Tx const &tx, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "Cancel2{{id={}}}", tx.id);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<goat::PaidTx> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::PaidTx const &tx, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Paid{{"
            "id={} "
            "tx_id={} "
            "tx_out={} "
            "amount={}"
            "}}",
            tx.id,
            tx.tx_id,
            tx.tx_out,
            tx.amount);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<goat::DepositTx> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::DepositTx const &tx, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "Deposit{{"
            "tx_id={} "
            "tx_out={} "
            "target={} "
            "amount={} "
            "tax={}"
            "}}",
            tx.tx_id,
            tx.tx_out,
            tx.target,
            tx.amount,
            tx.tax);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<goat::CompleteUnlockTx> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::CompleteUnlockTx const &tx, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "CompleteUnlock{{"
            "id={} "
            "recipient={} "
            "token={} "
            "amount={}"
            "}}",
            tx.id,
            tx.recipient,
            tx.token,
            tx.amount);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<goat::DistributeRewardTx> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::DistributeRewardTx const &tx, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "DistributeReward{{"
            "id={} "
            "recipient={} "
            "goat={} "
            "gas_reward={}"
            "}}",
            tx.id,
            tx.recipient,
            tx.goat,
            tx.gas_reward);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<goat::GoatTxInner> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::GoatTxInner const &inner, FormatContext &ctx) const
    {
        std::visit(
            [&ctx](auto const &tx) { fmt::format_to(ctx.out(), "{}", tx); },
            inner);
        return ctx.out();
    }
};

template <>
struct fmt::formatter<goat::GoatTransaction> : public goat::BasicFormatter
{
    template <typename FormatContext>
    auto format(goat::GoatTransaction const &tx, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "GoatTransaction{{"
            "module={} "
            "action={} "
            "nonce={} "
            "chain_id={} "
            "input=0x{:02x} ",
            tx.module,
            tx.action,
            tx.nonce,
            tx.chain_id,
            fmt::join(std::as_bytes(std::span(tx.input)), ""));
        if (tx.inner.has_value()) {
            fmt::format_to(ctx.out(), "inner={}}}", *tx.inner);
        }
        else {
            fmt::format_to(ctx.out(), "inner=unparsed}}");
        }
        return ctx.out();
    }
};
