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

#include "qkchash_native.h"

#include <algorithm>

#include "NativeCache.h"
#include "QkcHashCache.h"
#include "QkcHashErrors.h"
#include "libUtils/Logger.h"

using namespace qkchash;

void* cache_create(const uint64_t* cache_ptr, uint32_t size) {
  if (cache_ptr == nullptr && size > 0) {
    LOG_GENERAL(WARNING, "cache_create called with null values");
    return nullptr;
  }

  try {
    const auto cache = Cache::FromValues(Words(cache_ptr, cache_ptr + size));
    return new NativeCache(cache);
  } catch (const ConfigurationError& e) {
    LOG_GENERAL(WARNING, "cache_create rejected values: " << e.what());
  } catch (const std::bad_alloc& e) {
    LOG_GENERAL(WARNING, "cache_create out of memory for " << size
                                                           << " values");
  }
  return nullptr;
}

void cache_destroy(void* cache_ptr) {
  delete static_cast<NativeCache*>(cache_ptr);
}

void qkc_hash(void* cache_ptr, const uint64_t* seed_ptr, uint64_t* result_ptr) {
  MixDigestArray result{};

  if (cache_ptr == nullptr || seed_ptr == nullptr) {
    LOG_GENERAL(WARNING, "qkc_hash called with a null cache or seed");
  } else {
    SeedArray seed;
    std::copy(seed_ptr, seed_ptr + seed.size(), seed.begin());
    try {
      result = NativeMix(*static_cast<const NativeCache*>(cache_ptr), seed);
    } catch (const CapacityError& e) {
      LOG_GENERAL(WARNING, "qkc_hash failed: " << e.what());
      result.fill(0);
    } catch (const std::bad_alloc& e) {
      LOG_GENERAL(WARNING, "qkc_hash out of memory");
      result.fill(0);
    }
  }

  if (result_ptr != nullptr) {
    std::copy(result.begin(), result.end(), result_ptr);
  }
}
