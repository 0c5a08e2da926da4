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

#include "NativeCache.h"

#include <string>

#include "QkcHash.h"
#include "QkcHashCache.h"
#include "QkcHashErrors.h"
#include "libUtils/Logger.h"

using namespace std;

namespace qkchash {

NativeCache::NativeCache(const Cache& cache)
    : NativeCache(cache.Values().data(), cache.Size()) {}

NativeCache::NativeCache(const uint64_t* values, size_t size) {
  for (size_t i = 0; i < size; i++) {
    m_tree.insert(values[i]);
  }
}

MixDigestArray NativeMix(const NativeCache& cache, const SeedArray& seed) {
  if (cache.Size() < REMOVAL_BUDGET) {
    LOG_GENERAL(WARNING, "Native cache of " << cache.Size()
                                            << " entries cannot sustain "
                                            << REMOVAL_BUDGET << " removals");
    throw CapacityError("native cache of " + to_string(cache.Size()) +
                        " entries is too small");
  }

  OrderedTree tree(cache.Tree());

  array<uint64_t, MIX_WORDS> mix;
  for (size_t i = 0; i < mix.size(); i++) {
    mix[i] = seed[i % seed.size()];
  }

  for (uint64_t i = 0; i < ACCESS_ROUND; i++) {
    array<uint64_t, MIX_WORDS> newData;
    uint64_t p = Fnv64(i ^ seed[0], mix[i % mix.size()]);
    for (size_t j = 0; j < mix.size(); j++) {
      if (tree.empty()) {
        throw CapacityError("native working cache exhausted in round " +
                            to_string(i));
      }
      auto it = tree.find_by_order(p % tree.size());
      newData[j] = *it;
      tree.erase(it);

      p = Fnv64(p, newData[j]);
      tree.insert(p);
      p = Fnv64(p, newData[j]);
    }

    for (size_t j = 0; j < mix.size(); j++) {
      mix[j] = Fnv64(mix[j], newData[j]);
    }
  }

  MixDigestArray result;
  for (size_t i = 0; i < result.size(); i++) {
    const size_t k = i * MIX_COMPRESSION_GROUP;
    result[i] = Fnv64(Fnv64(Fnv64(mix[k], mix[k + 1]), mix[k + 2]), mix[k + 3]);
  }
  return result;
}

}  // namespace qkchash
