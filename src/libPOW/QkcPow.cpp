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

#include "QkcPow.h"

#include <algorithm>
#include <chrono>

#include "QkcHashErrors.h"
#include "libUtils/DataConversion.h"
#include "libUtils/JoinableFunction.h"
#include "libUtils/Logger.h"

using namespace std;

namespace qkchash {

QkcPow::QkcPow(BackendType backendType)
    : m_backendType(backendType), m_currentEntries(0),
      m_lastSession(0),
      m_stoppedSession(0) {}

QkcPow::~QkcPow() { StopMining(); }

string QkcPow::BlockhashToHexString(const Hash256& hash) {
  return DataConversion::StdArrayToHexStr(hash);
}

Hash256 QkcPow::StringToBlockhash(const string& s) {
  Hash256 ret{};
  if (!DataConversion::HexStrToStdArray(s, ret)) {
    LOG_GENERAL(WARNING, "Input to StringToBlockhash is not "
                             << ret.size()
                             << " bytes of hex. Returning zero hash");
    return Hash256{};
  }
  return ret;
}

bool QkcPow::CheckDifficulty(const Hash256& result, const Hash256& boundary) {
  return !lexicographical_compare(boundary.begin(), boundary.end(),
                                  result.begin(), result.end());
}

Hash256 QkcPow::DifficultyLevelInInt(uint8_t difficulty) {
  Hash256 b;
  b.fill(0xFF);
  const unsigned int firstNbytesToSet =
      min<unsigned int>(difficulty / 8, b.size());
  const unsigned int nBytesBitsToSet = difficulty % 8;

  for (unsigned int i = 0; i < firstNbytesToSet; i++) {
    b[i] = 0;
  }

  if (firstNbytesToSet < b.size()) {
    const unsigned char masks[] = {0xFF, 0x7F, 0x3F, 0x1F,
                                   0x0F, 0x07, 0x03, 0x01};
    b[firstNbytesToSet] = masks[nBytesBitsToSet];
  }
  return b;
}

bytes QkcPow::NonceToBytes(uint64_t nonce) {
  return DataConversion::IntegerToBytes<uint64_t, NONCE_SIZE>(nonce);
}

bool QkcPow::ConfigureEpoch(const bytes& seed, uint64_t entries,
                            unsigned int numThreads) {
  lock_guard<mutex> g(m_mutexConfigure);

  if (m_backend && seed == m_currentSeed && entries == m_currentEntries) {
    return true;
  }

  try {
    auto cache = make_shared<const Cache>(
        Cache::Build(entries, seed, max(numThreads, 1U)));
    m_backend = CreateBackend(m_backendType, move(cache));
  } catch (const ConfigurationError& e) {
    LOG_PAYLOAD(WARNING, "Failed to configure epoch: " << e.what() << ", seed",
                seed, Logger::MAX_BYTES_TO_DISPLAY);
    return false;
  }

  m_currentSeed = seed;
  m_currentEntries = entries;
  LOG_GENERAL(INFO, "Epoch configured with "
                        << BackendTypeToString(m_backendType)
                        << " backend, cache size "
                        << m_backend->GetCache()->Size());
  return true;
}

bool QkcPow::IsConfigured() const {
  lock_guard<mutex> g(m_mutexConfigure);
  return m_backend != nullptr;
}

CachePtr QkcPow::GetCache() const {
  lock_guard<mutex> g(m_mutexConfigure);
  return m_backend ? m_backend->GetCache() : nullptr;
}

shared_ptr<const HashBackend> QkcPow::GetBackend() const {
  lock_guard<mutex> g(m_mutexConfigure);
  return m_backend;
}

QkcHashResult QkcPow::LightHash(const bytes& header, const bytes& nonce) const {
  const auto backend = GetBackend();
  if (!backend) {
    LOG_GENERAL(WARNING, "LightHash called before an epoch is configured");
    throw ConfigurationError("no epoch configured");
  }
  return backend->Hash(header, nonce);
}

QkcHashResult QkcPow::LightHash(const bytes& header, uint64_t nonce) const {
  return LightHash(header, NonceToBytes(nonce));
}

qkchash_mining_result_t QkcPow::Mine(const bytes& header,
                                     const Hash256& boundary,
                                     uint64_t startNonce, int timeWindow,
                                     unsigned int numThreads) {
  LOG_MARKER();
  // Numbered before waiting for the lock, so a stop issued while this call
  // queues behind another session still applies to it
  const uint64_t session = ++m_lastSession;
  lock_guard<mutex> g(m_mutexPoWMine);

  qkchash_mining_result_t winningResult{"", "", 0, false};

  const auto backend = GetBackend();
  if (!backend) {
    LOG_GENERAL(WARNING, "Mine called before an epoch is configured");
    return winningResult;
  }

  atomic<bool> shouldMine{true};
  atomic<uint64_t> nextNonce{startNonce};
  mutex mutexResult;
  const auto startTime = chrono::steady_clock::now();

  auto miner = [&]() {
    while (shouldMine) {
      if (m_stoppedSession >= session) {
        if (shouldMine.exchange(false)) {
          LOG_GENERAL(INFO, "Mining session " << session << " stopped");
        }
        return;
      }

      const uint64_t nonce = nextNonce++;

      QkcHashResult mineResult;
      try {
        mineResult = backend->Hash(header, NonceToBytes(nonce));
      } catch (const CapacityError& e) {
        LOG_GENERAL(WARNING, "Mining aborted: " << e.what());
        shouldMine = false;
        return;
      }

      if (CheckDifficulty(mineResult.result, boundary)) {
        lock_guard<mutex> lock(mutexResult);
        if (!winningResult.success) {
          winningResult = {BlockhashToHexString(mineResult.result),
                           BlockhashToHexString(mineResult.mixDigest), nonce,
                           true};
        }
        shouldMine = false;
        return;
      }

      auto timePassedInSeconds =
          chrono::duration_cast<chrono::seconds>(chrono::steady_clock::now() -
                                                 startTime)
              .count();
      if (timePassedInSeconds > timeWindow) {
        if (shouldMine.exchange(false)) {
          LOG_GENERAL(WARNING,
                      "Time out while mining pow result, time "
                      "passed in seconds "
                          << timePassedInSeconds << ", time window "
                          << timeWindow);
        }
        return;
      }
    }
  };

  JoinableFunction miners(max(numThreads, 1U), miner);
  miners.join();

  return winningResult;
}

void QkcPow::StopMining() {
  const uint64_t session = m_lastSession;
  uint64_t stopped = m_stoppedSession;
  while (stopped < session &&
         !m_stoppedSession.compare_exchange_weak(stopped, session)) {
  }
}

bool QkcPow::Verify(const bytes& header, uint64_t nonce,
                    const Hash256& mixDigest, const Hash256& result,
                    const Hash256& boundary) const {
  LOG_MARKER();

  if (!CheckDifficulty(result, boundary)) {
    LOG_GENERAL(WARNING, "PoW solution doesn't meet difficulty requirement");
    return false;
  }

  QkcHashResult expected;
  try {
    expected = LightHash(header, nonce);
  } catch (const ConfigurationError& e) {
    LOG_GENERAL(WARNING, "Cannot verify PoW solution: " << e.what());
    return false;
  } catch (const CapacityError& e) {
    LOG_GENERAL(WARNING, "Cannot verify PoW solution: " << e.what());
    return false;
  }

  if (expected.mixDigest != mixDigest) {
    LOG_CHECK_FAIL("Mix digest", BlockhashToHexString(mixDigest),
                   BlockhashToHexString(expected.mixDigest));
    return false;
  }
  if (expected.result != result) {
    LOG_CHECK_FAIL("Result", BlockhashToHexString(result),
                   BlockhashToHexString(expected.result));
    return false;
  }
  return true;
}

}  // namespace qkchash
