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

#include <goat/execution/goat/chain/goat_mainnet.hpp>

#include <goat/core/config.hpp>
#include <goat/execution/goat/goat_types.hpp>

#include <cstdint>

GOAT_NAMESPACE_BEGIN

uint64_t GoatMainnet::get_chain_id() const
{
    return GOAT_MAINNET_CHAIN_ID;
}

GOAT_NAMESPACE_END
