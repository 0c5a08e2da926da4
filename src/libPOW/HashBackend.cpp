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

#include "HashBackend.h"

#include <algorithm>
#include <random>

#include "NativeCache.h"
#include "QkcHashErrors.h"
#include "libUtils/DataConversion.h"
#include "libUtils/Logger.h"

using namespace std;

namespace qkchash {

namespace {

const size_t AUDIT_MAX_HEADER_SIZE = 128;
const size_t AUDIT_MAX_NONCE_SIZE = 16;

bytes RandomBytes(mt19937_64& rng, size_t maxSize) {
  uniform_int_distribution<size_t> sizeDist(0, maxSize);
  uniform_int_distribution<unsigned int> byteDist(0, 0xFF);
  bytes result(sizeDist(rng));
  generate(result.begin(), result.end(),
           [&]() { return static_cast<uint8_t>(byteDist(rng)); });
  return result;
}

string ResultToString(const QkcHashResult& result) {
  return "mixDigest=" +
         DataConversion::Uint8VecToHexStrRet(
             bytes(result.mixDigest.begin(), result.mixDigest.end())) +
         " result=" +
         DataConversion::Uint8VecToHexStrRet(
             bytes(result.result.begin(), result.result.end()));
}

}  // namespace

string BackendTypeToString(BackendType type) {
  switch (type) {
    case BackendType::REFERENCE:
      return "reference";
    case BackendType::NATIVE:
      return "native";
  }
  return "unknown";
}

optional<BackendType> BackendTypeFromString(const string& name) {
  if (name == "reference") {
    return BackendType::REFERENCE;
  }
  if (name == "native") {
    return BackendType::NATIVE;
  }
  return nullopt;
}

HashBackend::HashBackend(CachePtr cache) : m_cache(move(cache)) {
  if (!m_cache) {
    LOG_GENERAL(WARNING, "Hash backend created without a cache");
    throw ConfigurationError("hash backend requires a cache");
  }
}

ReferenceBackend::ReferenceBackend(CachePtr cache)
    : HashBackend(move(cache)) {}

QkcHashResult ReferenceBackend::Hash(const bytes& header,
                                     const bytes& nonce) const {
  return QkcHash(header, nonce, *m_cache);
}

NativeBackend::NativeBackend(CachePtr cache)
    : HashBackend(move(cache)),
      m_nativeCache(make_unique<const NativeCache>(*m_cache)) {}

NativeBackend::~NativeBackend() = default;

QkcHashResult NativeBackend::Hash(const bytes& header,
                                  const bytes& nonce) const {
  const auto seed = SeedWords(header, nonce);

  SeedArray seedArray;
  copy(seed.begin(), seed.end(), seedArray.begin());

  const auto compressedMix = NativeMix(*m_nativeCache, seedArray);
  return MakeResult(seed, Words(compressedMix.begin(), compressedMix.end()));
}

unique_ptr<HashBackend> CreateBackend(BackendType type, CachePtr cache) {
  switch (type) {
    case BackendType::REFERENCE:
      return make_unique<ReferenceBackend>(move(cache));
    case BackendType::NATIVE:
      return make_unique<NativeBackend>(move(cache));
  }
  throw ConfigurationError("unknown hash backend");
}

AuditReport AuditBackend(const HashBackend& candidate, unsigned int samples,
                         uint64_t rngSeed) {
  LOG_MARKER();

  const ReferenceBackend reference(candidate.GetCache());
  mt19937_64 rng(rngSeed);

  AuditReport report;
  for (unsigned int i = 0; i < samples; i++) {
    const bytes header = RandomBytes(rng, AUDIT_MAX_HEADER_SIZE);
    const bytes nonce = RandomBytes(rng, AUDIT_MAX_NONCE_SIZE);

    const auto expected = reference.Hash(header, nonce);
    const auto received = candidate.Hash(header, nonce);
    report.samples++;

    if (received == expected) {
      continue;
    }

    report.mismatches++;
    LOG_PAYLOAD(WARNING, "Backend divergence on sample " << i << ", header",
                header, Logger::MAX_BYTES_TO_DISPLAY);
    LOG_PAYLOAD(WARNING, "Backend divergence on sample " << i << ", nonce",
                nonce, Logger::MAX_BYTES_TO_DISPLAY);
    LOG_CHECK_FAIL(BackendTypeToString(candidate.Type()) + " digest",
                   ResultToString(received), ResultToString(expected));

    if (!report.firstMismatch) {
      report.firstMismatch = i;
      report.firstHeader = header;
      report.firstNonce = nonce;
    }
  }

  LOG_GENERAL(INFO, "Audited " << BackendTypeToString(candidate.Type())
                               << " backend: " << report.samples
                               << " samples, " << report.mismatches
                               << " mismatches");
  return report;
}

void RequireEquivalence(const HashBackend& candidate, unsigned int samples,
                        uint64_t rngSeed) {
  const auto report = AuditBackend(candidate, samples, rngSeed);
  if (!report.Passed()) {
    throw EquivalenceError(
        BackendTypeToString(candidate.Type()) + " backend diverges on " +
        to_string(report.mismatches) + " of " + to_string(report.samples) +
        " samples, first at sample " + to_string(*report.firstMismatch));
  }
}

}  // namespace qkchash
