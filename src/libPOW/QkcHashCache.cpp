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

#include "QkcHashCache.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <unordered_set>

#include "QkcHashErrors.h"
#include "QkcHashWords.h"
#include "libCrypto/Keccak.h"
#include "libUtils/DataConversion.h"
#include "libUtils/JoinableFunction.h"
#include "libUtils/Logger.h"

using namespace std;

namespace qkchash {

namespace {

const uint64_t MAX_CACHE_BLOCKS = 1ULL << (BLOCK_INDEX_SIZE * 8);

Words HashBlock(const bytes& seed, uint32_t blockIndex) {
  const auto index =
      DataConversion::IntegerToBytes<uint32_t, BLOCK_INDEX_SIZE>(blockIndex);
  Keccak512 keccak;
  keccak.Update(seed);
  keccak.Update(index.data(), index.size());
  return DeserializeWords(keccak.Finalize());
}

Words BuildSerial(uint64_t numBlocks, const bytes& seed) {
  Words cache;
  unordered_set<uint64_t> cacheSet;
  cache.reserve(numBlocks * SEED_WORDS);
  cacheSet.reserve(numBlocks * SEED_WORDS);

  for (uint64_t i = 0; i < numBlocks; i++) {
    for (const auto& word : HashBlock(seed, static_cast<uint32_t>(i))) {
      if (cacheSet.insert(word).second) {
        cache.push_back(word);
      }
    }
  }

  sort(cache.begin(), cache.end());
  return cache;
}

// Workers fill disjoint slots of one buffer; deduplication and sorting run
// once over the whole buffer afterwards.
Words BuildParallel(uint64_t numBlocks, const bytes& seed,
                    unsigned int numThreads) {
  Words cache(numBlocks * SEED_WORDS, 0);
  atomic<uint64_t> nextBlock{0};

  auto worker = [&cache, &nextBlock, &seed, numBlocks]() {
    for (uint64_t i = nextBlock++; i < numBlocks; i = nextBlock++) {
      const auto words = HashBlock(seed, static_cast<uint32_t>(i));
      copy(words.begin(), words.end(), cache.begin() + i * SEED_WORDS);
    }
  };

  JoinableFunction workers(numThreads, worker);
  workers.join();

  sort(cache.begin(), cache.end());
  cache.erase(unique(cache.begin(), cache.end()), cache.end());
  return cache;
}

}  // namespace

void Cache::CheckEntries(uint64_t entries) {
  if (entries == 0 || entries % SEED_WORDS != 0) {
    LOG_GENERAL(WARNING, "Invalid cache entries " << entries
                                                  << ", must be a positive "
                                                     "multiple of "
                                                  << SEED_WORDS);
    throw ConfigurationError("cache entries must be a positive multiple of " +
                             to_string(SEED_WORDS) + ", got " +
                             to_string(entries));
  }

  if (entries / SEED_WORDS > MAX_CACHE_BLOCKS) {
    LOG_GENERAL(WARNING, "Invalid cache entries " << entries
                                                  << ", block index overflows "
                                                  << BLOCK_INDEX_SIZE
                                                  << " bytes");
    throw ConfigurationError("cache entries too large: " + to_string(entries));
  }
}

Cache Cache::Build(uint64_t entries, const bytes& seed,
                   unsigned int numThreads) {
  CheckEntries(entries);

  const uint64_t numBlocks = entries / SEED_WORDS;
  auto startTime = chrono::steady_clock::now();

  Words values = (numThreads > 1) ? BuildParallel(numBlocks, seed, numThreads)
                                  : BuildSerial(numBlocks, seed);

  auto elapsedMs = chrono::duration_cast<chrono::milliseconds>(
                       chrono::steady_clock::now() - startTime)
                       .count();
  LOG_PAYLOAD(INFO,
              "Built cache of " << values.size() << "/" << entries
                                << " entries in " << elapsedMs << " ms, seed",
              seed, Logger::MAX_BYTES_TO_DISPLAY);

  return Cache(move(values));
}

Cache Cache::FromValues(Words values) {
  auto violation = adjacent_find(values.begin(), values.end(),
                                 greater_equal<uint64_t>());
  if (violation != values.end()) {
    LOG_GENERAL(WARNING,
                "Cache values not strictly ascending at index "
                    << distance(values.begin(), violation) << ": " << *violation
                    << " >= " << *(violation + 1));
    throw ConfigurationError("cache values must be strictly ascending");
  }
  return Cache(move(values));
}

}  // namespace qkchash
