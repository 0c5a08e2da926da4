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

#include "QkcHash.h"

#include <string>

#include "QkcHashErrors.h"
#include "WorkingCache.h"
#include "libUtils/Logger.h"

using namespace std;

namespace qkchash {

Words SeedWords(const bytes& header, const bytes& nonce) {
  bytes input(header);
  input.insert(input.end(), nonce.rbegin(), nonce.rend());
  return Keccak512Words(input);
}

void CheckCapacity(const Cache& cache) {
  if (cache.Size() < REMOVAL_BUDGET) {
    LOG_GENERAL(WARNING, "Cache of " << cache.Size()
                                     << " entries cannot sustain "
                                     << REMOVAL_BUDGET << " removals");
    throw CapacityError("cache of " + to_string(cache.Size()) +
                        " entries is too small for " +
                        to_string(REMOVAL_BUDGET) + " removals");
  }
}

Words ReferenceMix(const Words& seed, const Cache& cache) {
  CheckCapacity(cache);

  Words mix;
  mix.reserve(MIX_WORDS);
  for (unsigned int i = 0; i < MIX_WORDS / SEED_WORDS; i++) {
    mix.insert(mix.end(), seed.begin(), seed.end());
  }

  WorkingCache workingCache(cache);
  Words newData(mix.size(), 0);

  for (uint64_t i = 0; i < ACCESS_ROUND; i++) {
    uint64_t p = Fnv64(i ^ seed[0], mix[i % mix.size()]);
    for (size_t j = 0; j < mix.size(); j++) {
      if (workingCache.Empty()) {
        LOG_GENERAL(WARNING, "Working cache exhausted in round " << i);
        throw CapacityError("working cache exhausted in round " +
                            to_string(i));
      }

      // Take out the p-th smallest value
      const uint64_t removed = workingCache.RemoveAt(p % workingCache.Size());

      // Derive a new value and put it back if it is not a duplicate
      p = Fnv64(p, removed);
      workingCache.Insert(p);

      // The next position is derived from the removed value again, not from
      // the inserted one
      p = Fnv64(p, removed);
      newData[j] = removed;
    }

    for (size_t j = 0; j < mix.size(); j++) {
      mix[j] = Fnv64(mix[j], newData[j]);
    }
  }

  Words compressedMix;
  compressedMix.reserve(MIX_DIGEST_WORDS);
  for (size_t i = 0; i < mix.size(); i += MIX_COMPRESSION_GROUP) {
    compressedMix.push_back(
        Fnv64(Fnv64(Fnv64(mix[i], mix[i + 1]), mix[i + 2]), mix[i + 3]));
  }
  return compressedMix;
}

QkcHashResult MakeResult(const Words& seed, const Words& compressedMix) {
  Words resultInput(seed);
  resultInput.insert(resultInput.end(), compressedMix.begin(),
                     compressedMix.end());

  return QkcHashResult{ToHash256(SerializeWords(compressedMix)),
                       ToHash256(SerializeWords(Keccak256Words(resultInput)))};
}

QkcHashResult QkcHash(const bytes& header, const bytes& nonce,
                      const Cache& cache) {
  const auto seed = SeedWords(header, nonce);
  return MakeResult(seed, ReferenceMix(seed, cache));
}

}  // namespace qkchash
