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

#ifndef QKCHASH_SRC_LIBPOW_WORKINGCACHE_H_
#define QKCHASH_SRC_LIBPOW_WORKINGCACHE_H_

#include <cstddef>
#include <unordered_set>

#include "common/BaseType.h"

namespace qkchash {

class Cache;

/**
 * @brief Private, mutable copy of a Cache used by one hash computation.
 *
 * Holds the values in ascending order plus a hash index for membership tests.
 * Both views are kept in sync by RemoveAt and Insert.
 *
 * The sorted vector makes RemoveAt and Insert O(n). This class is the
 * reference engine's straightforward layout; NativeCache provides the
 * O(log n) order-statistics tree used for mining.
 */
class WorkingCache {
 public:
  explicit WorkingCache(const Cache& cache);

  WorkingCache(const WorkingCache&) = delete;
  WorkingCache& operator=(const WorkingCache&) = delete;

  size_t Size() const { return m_values.size(); }
  bool Empty() const { return m_values.empty(); }

  bool Contains(uint64_t value) const { return m_members.count(value) > 0; }

  /// Removes and returns the index-th smallest value.
  /// @throw CapacityError if the cache is empty.
  /// @throw std::out_of_range if index >= Size().
  uint64_t RemoveAt(size_t index);

  /// Inserts value at its sorted position. Returns false, leaving the cache
  /// unchanged, if value is already present.
  bool Insert(uint64_t value);

  const Words& Values() const { return m_values; }

 private:
  Words m_values;
  std::unordered_set<uint64_t> m_members;
};

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBPOW_WORKINGCACHE_H_
