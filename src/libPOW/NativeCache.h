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

#ifndef QKCHASH_SRC_LIBPOW_NATIVECACHE_H_
#define QKCHASH_SRC_LIBPOW_NATIVECACHE_H_

#include <ext/pb_ds/assoc_container.hpp>
#include <ext/pb_ds/tree_policy.hpp>

#include <array>
#include <functional>

#include "common/BaseType.h"
#include "common/Constants.h"

namespace qkchash {

class Cache;

/// Red-black tree with order statistics: O(log n) select, erase and insert.
using OrderedTree =
    __gnu_pbds::tree<uint64_t, __gnu_pbds::null_type, std::less<uint64_t>,
                     __gnu_pbds::rb_tree_tag,
                     __gnu_pbds::tree_order_statistics_node_update>;

using SeedArray = std::array<uint64_t, SEED_WORDS>;
using MixDigestArray = std::array<uint64_t, MIX_DIGEST_WORDS>;

/**
 * @brief Cache representation of the accelerated backend.
 *
 * Built once from a Cache. NativeMix copies the tree for every computation,
 * so one NativeCache may be used from several threads at once.
 */
class NativeCache {
 public:
  explicit NativeCache(const Cache& cache);
  NativeCache(const uint64_t* values, size_t size);

  size_t Size() const { return m_tree.size(); }
  const OrderedTree& Tree() const { return m_tree; }

 private:
  OrderedTree m_tree;
};

/**
 * @brief Accelerated counterpart of ReferenceMix.
 * @throw CapacityError if the cache is too small.
 */
MixDigestArray NativeMix(const NativeCache& cache, const SeedArray& seed);

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBPOW_NATIVECACHE_H_
