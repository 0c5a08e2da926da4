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

#ifndef QKCHASH_SRC_LIBUTILS_DATACONVERSION_H_
#define QKCHASH_SRC_LIBUTILS_DATACONVERSION_H_

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "common/BaseType.h"

/// Utility class for data conversion operations.
class DataConversion {
 public:
  /// Decodes hex, with or without a "0x" prefix, in either case.
  /// Returns false and leaves out empty on malformed input.
  static bool HexStrToUint8Vec(const std::string& hex_input, bytes& out);

  /// Lower-case hex encoding.
  static bool Uint8VecToHexStr(const bytes& hex_vec, std::string& str);

  static std::string Uint8VecToHexStrRet(const bytes& hex_vec);

  /// Decodes hex of exactly SIZE bytes into a fixed-size array.
  template <size_t SIZE>
  static bool HexStrToStdArray(const std::string& hex_input,
                               std::array<uint8_t, SIZE>& out) {
    bytes decoded;
    if (!HexStrToUint8Vec(hex_input, decoded) || decoded.size() != SIZE) {
      return false;
    }
    std::copy(decoded.begin(), decoded.end(), out.begin());
    return true;
  }

  template <size_t SIZE>
  static std::string StdArrayToHexStr(const std::array<uint8_t, SIZE>& arr) {
    return Uint8VecToHexStrRet(bytes(arr.begin(), arr.end()));
  }

  static inline const bytes StringToCharArray(const std::string& input) {
    return bytes(input.begin(), input.end());
  }

  /// Big-endian encoding of the lowest SIZE bytes of value.
  template <typename T, size_t SIZE>
  static bytes IntegerToBytes(T value) {
    bytes result(SIZE);
    for (size_t i = 0; i < SIZE; i++) {
      result[SIZE - i - 1] = (value >> (i * 8));
    }
    return result;
  }
};

#endif  // QKCHASH_SRC_LIBUTILS_DATACONVERSION_H_
