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

#ifndef QKCHASH_SRC_LIBPOW_HASHBACKEND_H_
#define QKCHASH_SRC_LIBPOW_HASHBACKEND_H_

#include <memory>
#include <optional>
#include <string>

#include "QkcHash.h"
#include "QkcHashCache.h"

namespace qkchash {

class NativeCache;

enum class BackendType : uint8_t { REFERENCE, NATIVE };

std::string BackendTypeToString(BackendType type);

/// Parses "reference" or "native".
std::optional<BackendType> BackendTypeFromString(const std::string& name);

/**
 * @brief A way of computing QkcHash over one epoch cache.
 *
 * All variants must return bit-identical results for identical inputs.
 * Hash() is safe to call concurrently.
 */
class HashBackend {
 public:
  virtual ~HashBackend() = default;

  virtual BackendType Type() const = 0;

  virtual QkcHashResult Hash(const bytes& header, const bytes& nonce) const = 0;

  const CachePtr& GetCache() const { return m_cache; }

 protected:
  explicit HashBackend(CachePtr cache);

  CachePtr m_cache;
};

/// Sorted vector plus hash set, mirrors the algorithm step by step.
class ReferenceBackend final : public HashBackend {
 public:
  explicit ReferenceBackend(CachePtr cache);

  BackendType Type() const override { return BackendType::REFERENCE; }
  QkcHashResult Hash(const bytes& header, const bytes& nonce) const override;
};

/// Order-statistics tree, built once per epoch.
class NativeBackend final : public HashBackend {
 public:
  explicit NativeBackend(CachePtr cache);
  ~NativeBackend() override;

  BackendType Type() const override { return BackendType::NATIVE; }
  QkcHashResult Hash(const bytes& header, const bytes& nonce) const override;

 private:
  std::unique_ptr<const NativeCache> m_nativeCache;
};

/// @throw ConfigurationError if cache is null.
std::unique_ptr<HashBackend> CreateBackend(BackendType type, CachePtr cache);

/// Outcome of comparing a backend with the reference over a corpus.
struct AuditReport {
  unsigned int samples = 0;
  unsigned int mismatches = 0;
  std::optional<unsigned int> firstMismatch;
  bytes firstHeader;
  bytes firstNonce;

  bool Passed() const { return mismatches == 0; }
};

/**
 * @brief Compares candidate with the reference backend on the same cache.
 * @param samples Number of pseudo-random (header, nonce) pairs.
 * @param rngSeed Seed of the corpus generator, for reproducible audits.
 *
 * Every mismatch is counted and logged; nothing is averaged out.
 */
AuditReport AuditBackend(const HashBackend& candidate, unsigned int samples,
                         uint64_t rngSeed = 0);

/// AuditBackend, raising EquivalenceError on any mismatch.
void RequireEquivalence(const HashBackend& candidate, unsigned int samples,
                        uint64_t rngSeed = 0);

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBPOW_HASHBACKEND_H_
