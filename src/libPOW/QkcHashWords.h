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

#ifndef QKCHASH_SRC_LIBPOW_QKCHASHWORDS_H_
#define QKCHASH_SRC_LIBPOW_QKCHASHWORDS_H_

#include <array>

#include "common/BaseType.h"
#include "common/Constants.h"

namespace qkchash {

using Hash256 = std::array<uint8_t, HASH256_SIZE>;

/// FNV-1 style mixing step over 64-bit words.
inline uint64_t Fnv64(uint64_t v1, uint64_t v2) {
  return (v1 * FNV_PRIME_64) ^ v2;
}

/// Concatenates each word as WORD_BYTES little-endian bytes.
bytes SerializeWords(const Words& words);

/// Inverse of SerializeWords.
/// @throw std::invalid_argument if the length is not a multiple of WORD_BYTES.
Words DeserializeWords(const bytes& data);

/// Keccak-512 of the input, decoded into SEED_WORDS words.
Words Keccak512Words(const bytes& input);

/// Keccak-256 of the serialized words, decoded into 4 words.
Words Keccak256Words(const Words& input);

/// Copies exactly HASH256_SIZE bytes into a Hash256.
/// @throw std::invalid_argument on any other length.
Hash256 ToHash256(const bytes& data);

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBPOW_QKCHASHWORDS_H_
