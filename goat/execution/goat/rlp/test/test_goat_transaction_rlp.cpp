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
#include <goat/core/hex_literal.hpp>
#include <goat/execution/goat/chain/goat_mainnet.hpp>
#include <goat/execution/goat/chain/goat_testnet.hpp>
#include <goat/execution/goat/goat_error.hpp>
#include <goat/execution/goat/goat_transaction.hpp>
#include <goat/execution/goat/goat_types.hpp>
#include <goat/execution/goat/rlp/goat_transaction_rlp.hpp>
#include <goat/execution/goat/tx_bridge.hpp>
#include <goat/execution/goat/tx_locking.hpp>
#include <goat/execution/rlp/decode_error.hpp>
#include <goat/execution/rlp/encode.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <cstdint>
#include <variant>

using namespace goat;
using namespace goat::literals;
using namespace goat::rlp;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    byte_string const new_block_input =
        0x94f490bdbb7ba5e4830730dfa97c1eaaf199a8ef8ea2a865ca44c600fa032772a7af9edc_hex;

    GoatTransaction make_new_block_transaction()
    {
        return GoatTransaction{
            .module = modules::BRIDGE,
            .action = bridge_action::BITCOIN_NEW_BLOCK,
            .nonce = 0,
            .input = new_block_input};
    }

    GoatTransaction make_deposit_transaction()
    {
        return GoatTransaction{
            .module = modules::BRIDGE,
            .action = bridge_action::DEPOSIT,
            .nonce = 7,
            .input = DepositTx{
                .tx_id =
                    0x15bb90fa63b9a92e31d31f8d8d30bf8da9d9a21314c65dd517f27740ae676d6e_bytes32,
                .tx_out = 0x2a71a778,
                .target = 0x5e4e4d79f08120352f04d638adec7d3892b28045_address,
                .amount = 0x157f7f97_u256,
                .tax = 100}
                         .encode()};
    }
}

TEST(GoatTransactionRlp, encode_short_list)
{
    auto const tx = make_new_block_transaction();
    auto const encoded = encode_goat_transaction(tx);
    EXPECT_EQ(encoded, 0xe8010480a4_hex + new_block_input);
}

TEST(GoatTransactionRlp, encode_long_list)
{
    auto const tx = make_deposit_transaction();
    auto const encoded = encode_goat_transaction(tx);
    EXPECT_EQ(encoded, 0xf8a9010107b8a4_hex + tx.input);
}

TEST(GoatTransactionRlp, zero_fields_encode_as_empty_string)
{
    GoatTransaction const tx{
        .module = 0, .action = 0, .nonce = 0, .input = {}};
    EXPECT_EQ(encode_goat_transaction(tx), 0xc480808080_hex);
}

TEST(GoatTransactionRlp, signing_payload)
{
    auto const tx = make_new_block_transaction();
    auto const encoded = encode_goat_transaction(tx);
    auto const signing = encode_goat_transaction_for_signing(tx);

    ASSERT_EQ(signing.size(), encoded.size() + 1);
    EXPECT_EQ(signing[0], GOAT_TX_TYPE);
    EXPECT_EQ(signing.substr(1), encoded);
    EXPECT_EQ(signing_payload_length(tx), signing.size());
    EXPECT_EQ(encode_goat_transaction_typed(tx), signing);
}

TEST(GoatTransactionRlp, decode)
{
    GoatMainnet const chain{};
    auto const tx = make_deposit_transaction();
    auto const encoded = encode_goat_transaction(tx);
    byte_string_view enc{encoded};

    auto const res = decode_goat_transaction(enc, chain);
    ASSERT_FALSE(res.has_error());
    EXPECT_TRUE(enc.empty());

    auto const &decoded = res.value();
    EXPECT_EQ(decoded.module, tx.module);
    EXPECT_EQ(decoded.action, tx.action);
    EXPECT_EQ(decoded.nonce, tx.nonce);
    EXPECT_EQ(decoded.input, tx.input);
    EXPECT_EQ(decoded.chain_id, 2345u);
    ASSERT_TRUE(decoded.is_parsed());
    EXPECT_TRUE(std::holds_alternative<DepositTx>(decoded.get_inner()));
    EXPECT_EQ(decoded.sender(), RELAYER_EXECUTOR);
    EXPECT_EQ(decoded.destination(), BRIDGE_CONTRACT);
    ASSERT_TRUE(decoded.deposit().has_value());
    EXPECT_EQ(decoded.deposit()->amount, 0x157f7f97_u256);

    auto expected = tx;
    expected.set_chain_id(2345);
    ASSERT_FALSE(expected.decode_inner().has_error());
    EXPECT_EQ(decoded, expected);
    EXPECT_EQ(encode_goat_transaction(decoded), encoded);
}

TEST(GoatTransactionRlp, decode_stamps_chain_id)
{
    GoatTestnet const chain{};
    auto const encoded = encode_goat_transaction(make_new_block_transaction());
    byte_string_view enc{encoded};

    auto const res = decode_goat_transaction(enc, chain);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(res.value().chain_id, 48816u);
}

TEST(GoatTransactionRlp, decode_leaves_trailing_input)
{
    GoatMainnet const chain{};
    auto const trailing = 0xabcd_hex;
    auto const encoded =
        encode_goat_transaction(make_new_block_transaction()) + trailing;
    byte_string_view enc{encoded};

    auto const res = decode_goat_transaction(enc, chain);
    ASSERT_FALSE(res.has_error());
    EXPECT_EQ(enc, byte_string_view{trailing});
}

TEST(GoatTransactionRlp, decode_typed)
{
    GoatMainnet const chain{};
    auto const tx = make_new_block_transaction();
    auto const encoded = encode_goat_transaction_typed(tx);
    byte_string_view enc{encoded};

    auto const res = decode_goat_transaction_typed(enc, chain);
    ASSERT_FALSE(res.has_error());
    EXPECT_TRUE(enc.empty());
    EXPECT_TRUE(
        std::holds_alternative<NewBtcBlockTx>(res.value().get_inner()));
    EXPECT_FALSE(res.value().deposit().has_value());
    EXPECT_FALSE(res.value().withdraw().has_value());
}

TEST(GoatTransactionRlp, decode_typed_errors)
{
    GoatMainnet const chain{};
    {
        byte_string_view enc{};
        auto const res = decode_goat_transaction_typed(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::InputTooShort);
    }
    {
        auto const encoded =
            0x02_hex + encode_goat_transaction(make_new_block_transaction());
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction_typed(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::InvalidTxnType);
    }
    {
        // untyped list handed to the typed decoder
        auto const encoded =
            encode_goat_transaction(make_new_block_transaction());
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction_typed(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::InvalidTxnType);
    }
}

TEST(GoatTransactionRlp, decode_malformed_list)
{
    GoatMainnet const chain{};
    auto const tx = make_new_block_transaction();
    {
        auto const encoded = encode_list2(
            encode_unsigned(tx.module),
            encode_unsigned(tx.action),
            encode_unsigned(tx.nonce),
            encode_string2(tx.input),
            encode_unsigned(uint64_t{1}));
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::InputTooLong);
    }
    {
        auto const encoded = encode_list2(
            encode_unsigned(tx.module),
            encode_unsigned(tx.action),
            encode_unsigned(tx.nonce));
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::InputTooShort);
    }
    {
        auto const encoded = encode_list2(
            encode_unsigned(uint16_t{0x100}),
            encode_unsigned(tx.action),
            encode_unsigned(tx.nonce),
            encode_string2(tx.input));
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::Overflow);
    }
    {
        // nonce 1 with a leading zero byte
        auto const encoded = encode_list2(
            encode_unsigned(tx.module),
            encode_unsigned(tx.action),
            0x820001_hex,
            encode_string2(tx.input));
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::LeadingZero);
    }
    {
        auto const encoded = encode_string2(tx.input);
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::TypeUnexpected);
    }
    {
        auto const full = encode_goat_transaction(tx);
        byte_string_view enc = byte_string_view{full}.substr(0, full.size() - 1);
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::InputTooShort);
    }
}

TEST(GoatTransactionRlp, decode_rejects_unroutable_payload)
{
    GoatMainnet const chain{};
    {
        auto tx = make_new_block_transaction();
        tx.module = 99;
        auto const encoded = encode_goat_transaction(tx);
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), GoatTxError::UnknownModule);
    }
    {
        auto tx = make_new_block_transaction();
        tx.action = 99;
        auto const encoded = encode_goat_transaction(tx);
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), GoatTxError::UnknownAction);
    }
    {
        auto tx = make_new_block_transaction();
        tx.input[1] ^= 0x01;
        auto const encoded = encode_goat_transaction(tx);
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), GoatTxError::SelectorMismatch);
    }
}

TEST(GoatTransactionRlp, decode_rejects_non_canonical)
{
    GoatMainnet const chain{};
    {
        // module 1 wrapped as a one byte string
        auto const encoded = 0xe98101_hex + 0x0480a4_hex + new_block_input;
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::NonCanonical);
    }
    {
        // 40 byte list behind a long form header
        auto const encoded = 0xf828010480a4_hex + new_block_input;
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::NonCanonical);
    }
    {
        // 36 byte payload string behind a long form header
        auto const encoded = 0xe9010480b824_hex + new_block_input;
        byte_string_view enc{encoded};
        auto const res = decode_goat_transaction(enc, chain);
        ASSERT_TRUE(res.has_error());
        EXPECT_EQ(res.assume_error(), DecodeError::NonCanonical);
    }
}

namespace
{
    template <typename T>
    struct TxRoute;

    template <>
    struct TxRoute<NewBtcBlockTx>
    {
        static constexpr Module module = modules::BRIDGE;
        static constexpr Action action = bridge_action::BITCOIN_NEW_BLOCK;
    };

    template <>
    struct TxRoute<Cancel2Tx>
    {
        static constexpr Module module = modules::BRIDGE;
        static constexpr Action action = bridge_action::CANCEL2;
    };

    template <>
    struct TxRoute<PaidTx>
    {
        static constexpr Module module = modules::BRIDGE;
        static constexpr Action action = bridge_action::PAID;
    };

    template <>
    struct TxRoute<DepositTx>
    {
        static constexpr Module module = modules::BRIDGE;
        static constexpr Action action = bridge_action::DEPOSIT;
    };

    template <>
    struct TxRoute<CompleteUnlockTx>
    {
        static constexpr Module module = modules::LOCKING;
        static constexpr Action action = locking_action::COMPLETE_UNLOCK;
    };

    template <>
    struct TxRoute<DistributeRewardTx>
    {
        static constexpr Module module = modules::LOCKING;
        static constexpr Action action = locking_action::DISTRIBUTE_REWARD;
    };
}

template <typename T>
class GoatTransactionRlpRoundTrip : public ::testing::Test
{
};

typedef ::testing::Types<
    NewBtcBlockTx, Cancel2Tx, PaidTx, DepositTx, CompleteUnlockTx,
    DistributeRewardTx>
    GoatTxTypes;
TYPED_TEST_SUITE(GoatTransactionRlpRoundTrip, GoatTxTypes);

TYPED_TEST(GoatTransactionRlpRoundTrip, decode_after_encode)
{
    GoatTestnet const chain{};
    auto tx = make_goat_transaction(
        chain,
        TxRoute<TypeParam>::module,
        TxRoute<TypeParam>::action,
        0x1234,
        TypeParam{}.encode());
    ASSERT_FALSE(tx.decode_inner().has_error());

    auto const encoded = encode_goat_transaction_typed(tx);
    byte_string_view enc{encoded};
    auto const res = decode_goat_transaction_typed(enc, chain);
    ASSERT_FALSE(res.has_error());
    EXPECT_TRUE(enc.empty());
    EXPECT_EQ(res.value(), tx);
    EXPECT_TRUE(std::holds_alternative<TypeParam>(res.value().get_inner()));
    EXPECT_EQ(encode_goat_transaction_typed(res.value()), encoded);
}
