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

#ifndef QKCHASH_SRC_LIBCRYPTO_KECCAK_H_
#define QKCHASH_SRC_LIBCRYPTO_KECCAK_H_

#include <ethash/keccak.hpp>

#include <algorithm>

#include "common/BaseType.h"

namespace qkchash {

/// List of supported hash variants.
class HASH_TYPE {
 public:
  static const unsigned int HASH_VARIANT_256 = 256;
  static const unsigned int HASH_VARIANT_512 = 512;
};

/**
 * @brief Legacy Keccak (pre-FIPS-202 padding), as used by Ethereum.
 * @tparam SIZE Output size in bits, 256 or 512.
 *
 * Input is buffered by Update() and hashed in one shot by Finalize(), which
 * can be called repeatedly and does not reset the accumulated message.
 */
template <unsigned int SIZE>
class Keccak {
  static_assert(SIZE == HASH_TYPE::HASH_VARIANT_256 ||
                    SIZE == HASH_TYPE::HASH_VARIANT_512,
                "unsupported Keccak variant");

  bytes m_message;

 public:
  static const unsigned int HASH_OUTPUT_SIZE = SIZE / 8;

  /// Hash update function.
  void Update(const bytes& input) {
    m_message.insert(m_message.end(), input.begin(), input.end());
  }

  /// Hash update function.
  void Update(const uint8_t* data, size_t size) {
    m_message.insert(m_message.end(), data, data + size);
  }

  /// Hash finalize function.
  bytes Finalize() const {
    bytes output(HASH_OUTPUT_SIZE);
    if constexpr (SIZE == HASH_TYPE::HASH_VARIANT_256) {
      const auto hash = ethash::keccak256(m_message.data(), m_message.size());
      std::copy(std::begin(hash.bytes), std::end(hash.bytes), output.begin());
    } else {
      const auto hash = ethash::keccak512(m_message.data(), m_message.size());
      std::copy(std::begin(hash.bytes), std::end(hash.bytes), output.begin());
    }
    return output;
  }
};

using Keccak256 = Keccak<HASH_TYPE::HASH_VARIANT_256>;
using Keccak512 = Keccak<HASH_TYPE::HASH_VARIANT_512>;

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBCRYPTO_KECCAK_H_
