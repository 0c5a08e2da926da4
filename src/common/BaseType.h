/*
 * Copyright (C) 2019 Zilliqa
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef QKCHASH_SRC_COMMON_BASETYPE_H_
#define QKCHASH_SRC_COMMON_BASETYPE_H_

#include <stdint.h>
#include <vector>

using bytes = std::vector<uint8_t>;

namespace qkchash {

/// Sequence of 64-bit words, the numeric domain of the hash algorithm.
using Words = std::vector<uint64_t>;

}  // namespace qkchash

#endif  // QKCHASH_SRC_COMMON_BASETYPE_H_
