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

#ifndef QKCHASH_SRC_LIBPOW_QKCHASH_NATIVE_H_
#define QKCHASH_SRC_LIBPOW_QKCHASH_NATIVE_H_

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/// Builds a native cache from size strictly ascending values.
/// Returns NULL if the values are not strictly ascending.
void* cache_create(const uint64_t* cache_ptr, uint32_t size);

/// Releases a cache returned by cache_create. NULL is ignored.
void cache_destroy(void* cache_ptr);

/// Computes the compressed mix for seed, the 8 words of
/// keccak512(header || reversed nonce). On failure result is zeroed.
void qkc_hash(void* cache_ptr, const uint64_t* seed_ptr, uint64_t* result_ptr);

#ifdef __cplusplus
}
#endif

#endif  // QKCHASH_SRC_LIBPOW_QKCHASH_NATIVE_H_
