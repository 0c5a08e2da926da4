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

#ifndef QKCHASH_SRC_LIBPOW_QKCHASH_H_
#define QKCHASH_SRC_LIBPOW_QKCHASH_H_

#include "QkcHashCache.h"
#include "QkcHashWords.h"
#include "common/BaseType.h"

namespace qkchash {

/// Upper bound on the removals a single hash computation performs.
const size_t REMOVAL_BUDGET = static_cast<size_t>(ACCESS_ROUND) * MIX_WORDS;

/// Output of one QkcHash computation.
struct QkcHashResult {
  Hash256 mixDigest;
  Hash256 result;

  bool operator==(const QkcHashResult& other) const = default;
};

/// keccak512(header || reversed nonce), as SEED_WORDS words.
Words SeedWords(const bytes& header, const bytes& nonce);

/**
 * @brief Rejects caches that could be exhausted by one computation.
 * @throw CapacityError if cache.Size() < REMOVAL_BUDGET.
 *
 * Every removal may fail to be paired with an insertion. A cache of
 * REMOVAL_BUDGET values still holds one value before the last removal, so
 * only smaller caches can run empty mid-computation.
 */
void CheckCapacity(const Cache& cache);

/**
 * @brief Runs the ACCESS_ROUND mutation rounds over a private copy of cache.
 * @return The compressed mix, MIX_DIGEST_WORDS words.
 * @throw CapacityError if the cache is too small.
 */
Words ReferenceMix(const Words& seed, const Cache& cache);

/// Builds the digest from the seed words and the compressed mix.
QkcHashResult MakeResult(const Words& seed, const Words& compressedMix);

/**
 * @brief Reference QkcHash.
 *
 * Pure function of its inputs; cache is only read, so one Cache may be shared
 * by concurrent calls.
 * @throw CapacityError if the cache is too small.
 */
QkcHashResult QkcHash(const bytes& header, const bytes& nonce,
                      const Cache& cache);

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBPOW_QKCHASH_H_
