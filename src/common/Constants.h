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

#ifndef QKCHASH_SRC_COMMON_CONSTANTS_H_
#define QKCHASH_SRC_COMMON_CONSTANTS_H_

#include <stdint.h>
#include <string>

// Data sizes
const unsigned int WORD_BYTES = 8;
const unsigned int HASH512_SIZE = 64;
const unsigned int HASH256_SIZE = 32;
const unsigned int BLOCK_INDEX_SIZE = 4;

// Proof-of-work constants. These are consensus-critical and must never be
// read from configuration.
const uint64_t FNV_PRIME_64 = 0x100000001b3ULL;
const unsigned int ACCESS_ROUND = 64;
const unsigned int DEFAULT_CACHE_ENTRIES = 1024 * 64;
const unsigned int SEED_WORDS = HASH512_SIZE / WORD_BYTES;
const unsigned int MIX_WORDS = 2 * SEED_WORDS;
const unsigned int MIX_COMPRESSION_GROUP = 4;
const unsigned int MIX_DIGEST_WORDS = MIX_WORDS / MIX_COMPRESSION_GROUP;
const unsigned int NONCE_SIZE = 8;

const std::string CONSTANTS_FILE = "constants.xml";

// Logging constants
extern const unsigned int MAX_LOG_FILE_SIZE_KB;
extern const unsigned int MAX_ARCHIVED_LOG_COUNT;

// PoW constants
extern const unsigned int CACHE_ENTRIES;
extern const unsigned int BUILD_CACHE_THREADS;
extern const unsigned int NUM_MINING_THREADS;
extern const unsigned int POW_WINDOW_IN_SECONDS;
extern const std::string POW_BACKEND;

// Benchmark and audit constants
extern const unsigned int BENCHMARK_NUM_HASHES;
extern const unsigned int BENCHMARK_PROGRESS_STEPS;
extern const unsigned int EQUIVALENCE_AUDIT_SAMPLES;

#endif  // QKCHASH_SRC_COMMON_CONSTANTS_H_
