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

#include <goat/core/basic_formatter.hpp> // NOLINT
#include <goat/core/byte_string.hpp>
#include <goat/core/config.hpp>
#include <goat/core/hex_literal.hpp>
#include <goat/core/likely.h>
#include <goat/core/log_level_map.hpp>
#include <goat/execution/core/fmt/address_fmt.hpp> // NOLINT
#include <goat/execution/goat/chain/chain_config.h>
#include <goat/execution/goat/chain/goat_chain.hpp>
#include <goat/execution/goat/fmt/goat_fmt.hpp> // NOLINT
#include <goat/execution/goat/goat_error.hpp>
#include <goat/execution/goat/goat_transaction.hpp>
#include <goat/execution/goat/goat_types.hpp>
#include <goat/execution/goat/rlp/goat_transaction_rlp.hpp>

#include <CLI/CLI.hpp>

#include <evmc/hex.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/bundled/fmt/core.h>
#include <quill/bundled/fmt/format.h>

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>

GOAT_ANONYMOUS_NAMESPACE_BEGIN

std::map<std::string, goat_chain_config> const chain_map = {
    {"mainnet", CHAIN_CONFIG_GOAT_MAINNET},
    {"testnet", CHAIN_CONFIG_GOAT_TESTNET}};

void print_mint(char const *const label, std::optional<Mint> const &mint)
{
    if (mint.has_value()) {
        fmt::println("{:<12} {}", label, mint.value());
    }
    else {
        fmt::println("{:<12} none", label);
    }
}

GOAT_ANONYMOUS_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    using namespace goat;

    CLI::App cli{"goat_tx_decode"};
    cli.option_defaults()->always_capture_default();

    std::string tx_hex{};
    auto chain_config = CHAIN_CONFIG_GOAT_MAINNET;
    auto log_level = quill::LogLevel::Info;

    cli.add_option(
        "--tx",
        tx_hex,
        "hex encoded goat transaction, typed or untyped; read from stdin if "
        "omitted");
    cli.add_option("--chain", chain_config, "chain the transaction belongs to")
        ->transform(CLI::CheckedTransformer(chain_map, CLI::ignore_case));
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::CallForHelp const &e) {
        return cli.exit(e);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    if (tx_hex.empty()) {
        tx_hex.assign(
            std::istreambuf_iterator<char>{std::cin},
            std::istreambuf_iterator<char>{});
    }

    auto const encoded = parse_hex(tx_hex);
    if (GOAT_UNLIKELY(!encoded.has_value() || encoded->empty())) {
        LOG_ERROR("input is not a hex encoded transaction");
        return EXIT_FAILURE;
    }

    auto const chain = make_goat_chain(chain_config);
    byte_string_view enc{*encoded};
    auto const res = enc.front() == GOAT_TX_TYPE
                         ? rlp::decode_goat_transaction_typed(enc, *chain)
                         : rlp::decode_goat_transaction(enc, *chain);
    if (GOAT_UNLIKELY(res.has_error())) {
        if (auto const sizes = length_mismatch_sizes(res.assume_error())) {
            LOG_ERROR(
                "could not decode goat transaction: payload is {} bytes, "
                "expected {}",
                sizes->actual,
                sizes->expected);
            return EXIT_FAILURE;
        }
        LOG_ERROR(
            "could not decode goat transaction: {}",
            res.assume_error().message().c_str());
        return EXIT_FAILURE;
    }
    if (GOAT_UNLIKELY(!enc.empty())) {
        LOG_ERROR("{} trailing bytes after goat transaction", enc.size());
        return EXIT_FAILURE;
    }

    auto const &tx = res.assume_value();
    fmt::println("{:<12} {}", "module", tx.module);
    fmt::println("{:<12} {}", "action", tx.action);
    fmt::println("{:<12} {}", "nonce", tx.nonce);
    fmt::println("{:<12} {}", "chain_id", tx.chain_id);
    fmt::println("{:<12} {}", "inner", tx.get_inner());
    fmt::println("{:<12} {}", "sender", tx.sender());
    fmt::println("{:<12} {}", "destination", tx.destination());
    print_mint("deposit", tx.deposit());
    print_mint("withdraw", tx.withdraw());
    fmt::println(
        "{:<12} 0x{}",
        "signing",
        evmc::hex(rlp::encode_goat_transaction_for_signing(tx)));
    return EXIT_SUCCESS;
}
