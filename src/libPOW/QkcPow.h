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

#ifndef QKCHASH_SRC_LIBPOW_QKCPOW_H_
#define QKCHASH_SRC_LIBPOW_QKCPOW_H_

#include <stdint.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "HashBackend.h"
#include "QkcHash.h"
#include "QkcHashCache.h"
#include "common/Constants.h"

namespace qkchash {

/// Stores the result of PoW mining.
typedef struct qkchash_mining_result {
  std::string result;
  std::string mix_hash;
  uint64_t winning_nonce;
  bool success;
} qkchash_mining_result_t;

/**
 * @brief Proof-of-work front end for one node.
 *
 * Owns the cache of the current epoch and the backend computing over it.
 * Reconfiguring to a new seed swaps in a new cache; computations already
 * running keep the cache they started with.
 */
class QkcPow {
  mutable std::mutex m_mutexConfigure;
  std::mutex m_mutexPoWMine;

  BackendType m_backendType;
  bytes m_currentSeed;
  uint64_t m_currentEntries;
  std::shared_ptr<const HashBackend> m_backend;
  // Mine calls are numbered from 1; every call numbered up to
  // m_stoppedSession has been asked to stop
  std::atomic<uint64_t> m_lastSession;
  std::atomic<uint64_t> m_stoppedSession;

 public:
  explicit QkcPow(BackendType backendType = BackendType::NATIVE);
  ~QkcPow();

  QkcPow(QkcPow const&) = delete;
  void operator=(QkcPow const&) = delete;

  static std::string BlockhashToHexString(const Hash256& hash);
  static Hash256 StringToBlockhash(const std::string& s);

  /// True if result <= boundary, both read as big-endian integers.
  static bool CheckDifficulty(const Hash256& result, const Hash256& boundary);

  /// Boundary with the leading difficulty bits cleared.
  static Hash256 DifficultyLevelInInt(uint8_t difficulty);

  /// Nonce encoding used by the miner, NONCE_SIZE bytes big-endian.
  static bytes NonceToBytes(uint64_t nonce);

  /**
   * @brief Prepares the cache for the epoch identified by seed.
   * @return false if entries is invalid; the previous epoch is kept then.
   *
   * Does nothing if seed and entries match the current epoch.
   */
  bool ConfigureEpoch(const bytes& seed, uint64_t entries = CACHE_ENTRIES,
                      unsigned int numThreads = BUILD_CACHE_THREADS);

  bool IsConfigured() const;

  /// Current epoch cache, or null before ConfigureEpoch succeeded.
  CachePtr GetCache() const;

  /// Current backend, or null before ConfigureEpoch succeeded.
  std::shared_ptr<const HashBackend> GetBackend() const;

  BackendType GetBackendType() const { return m_backendType; }

  /// @throw ConfigurationError if no epoch is configured.
  /// @throw CapacityError if the epoch cache is too small.
  QkcHashResult LightHash(const bytes& header, const bytes& nonce) const;
  QkcHashResult LightHash(const bytes& header, uint64_t nonce) const;

  /// Searches nonces from startNonce until a result meets boundary,
  /// StopMining() is called or timeWindow seconds pass.
  qkchash_mining_result_t Mine(const bytes& header, const Hash256& boundary,
                               uint64_t startNonce, int timeWindow,
                               unsigned int numThreads = NUM_MINING_THREADS);

  /// Terminates every Mine call already entered, including calls still
  /// waiting for a running session to finish. Later calls are unaffected.
  void StopMining();

  /// Verifies a proof-of-work submission by recomputing its digest.
  bool Verify(const bytes& header, uint64_t nonce, const Hash256& mixDigest,
              const Hash256& result, const Hash256& boundary) const;
};

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBPOW_QKCPOW_H_
