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
#include <goat/execution/goat/chain/chain_config.h>
#include <goat/execution/goat/chain/goat_chain.hpp>
#include <goat/execution/goat/chain/goat_mainnet.hpp>
#include <goat/execution/goat/chain/goat_testnet.hpp>

#include <memory>

GOAT_NAMESPACE_BEGIN

std::unique_ptr<GoatChain> make_goat_chain(goat_chain_config const config)
{
    switch (config) {
    case CHAIN_CONFIG_GOAT_MAINNET:
        return std::make_unique<GoatMainnet>();
    case CHAIN_CONFIG_GOAT_TESTNET:
        return std::make_unique<GoatTestnet>();
    }
    GOAT_ASSERT(false);
    return nullptr;
}

GOAT_NAMESPACE_END
