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

#include <cstdlib>
#include <iostream>

extern char const *__progname;

void goat_assertion_failed(
    char const *const expr, char const *const function, char const *const file,
    long const line)
{
    std::cerr << __progname << ": " << file << ':' << line << ": " << function
              << ": Assertion '" << expr << "' failed." << std::endl;
    std::cerr << std::flush;
    std::abort();
}
