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

#include "QkcHashWords.h"

#include <algorithm>
#include <stdexcept>

#include "libCrypto/Keccak.h"
#include "libUtils/Logger.h"

using namespace std;

namespace qkchash {

bytes SerializeWords(const Words& words) {
  bytes result;
  result.reserve(words.size() * WORD_BYTES);
  for (const auto& word : words) {
    for (unsigned int i = 0; i < WORD_BYTES; i++) {
      result.push_back(static_cast<uint8_t>(word >> (i * 8)));
    }
  }
  return result;
}

Words DeserializeWords(const bytes& data) {
  if (data.size() % WORD_BYTES != 0) {
    LOG_GENERAL(WARNING, "Cannot decode " << data.size()
                                          << " bytes into words of "
                                          << WORD_BYTES << " bytes");
    throw invalid_argument("byte length is not a multiple of the word size");
  }

  Words result(data.size() / WORD_BYTES, 0);
  for (size_t w = 0; w < result.size(); w++) {
    uint64_t word = 0;
    for (unsigned int i = 0; i < WORD_BYTES; i++) {
      word |= static_cast<uint64_t>(data[w * WORD_BYTES + i]) << (i * 8);
    }
    result[w] = word;
  }
  return result;
}

Words Keccak512Words(const bytes& input) {
  Keccak512 keccak;
  keccak.Update(input);
  return DeserializeWords(keccak.Finalize());
}

Words Keccak256Words(const Words& input) {
  Keccak256 keccak;
  keccak.Update(SerializeWords(input));
  return DeserializeWords(keccak.Finalize());
}

Hash256 ToHash256(const bytes& data) {
  if (data.size() != HASH256_SIZE) {
    throw invalid_argument("expected " + to_string(HASH256_SIZE) +
                           " bytes, got " + to_string(data.size()));
  }
  Hash256 result;
  copy(data.begin(), data.end(), result.begin());
  return result;
}

}  // namespace qkchash
