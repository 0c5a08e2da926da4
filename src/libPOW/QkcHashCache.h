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

#ifndef QKCHASH_SRC_LIBPOW_QKCHASHCACHE_H_
#define QKCHASH_SRC_LIBPOW_QKCHASHCACHE_H_

#include <memory>

#include "common/BaseType.h"
#include "common/Constants.h"

namespace qkchash {

/**
 * @brief The epoch dataset: a strictly ascending set of 64-bit words.
 *
 * A Cache is immutable once constructed and may be read concurrently by any
 * number of hash computations. Share it through CachePtr.
 */
class Cache {
 public:
  /**
   * @brief Derives the cache for a seed.
   * @param entries Target cardinality, a positive multiple of 8.
   * @param seed Epoch seed.
   * @param numThreads Worker threads hashing the blocks. Does not affect the
   * result.
   * @throw ConfigurationError if entries is invalid. Nothing is hashed then.
   *
   * Block i contributes the 8 words of keccak512(seed || be32(i)). Duplicate
   * words are dropped, never replaced, so the result may hold fewer than
   * entries values.
   */
  static Cache Build(uint64_t entries, const bytes& seed,
                     unsigned int numThreads = 1);

  /**
   * @brief Adopts an existing cache value sequence.
   * @throw ConfigurationError unless values are strictly ascending.
   */
  static Cache FromValues(Words values);

  /// Validates a target cardinality without building anything.
  /// @throw ConfigurationError if entries is invalid.
  static void CheckEntries(uint64_t entries);

  const Words& Values() const { return m_values; }
  size_t Size() const { return m_values.size(); }
  uint64_t operator[](size_t index) const { return m_values[index]; }

  bool operator==(const Cache& other) const = default;

 private:
  explicit Cache(Words values) : m_values(std::move(values)) {}

  Words m_values;
};

using CachePtr = std::shared_ptr<const Cache>;

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBPOW_QKCHASHCACHE_H_
