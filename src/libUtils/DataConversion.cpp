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

#include "DataConversion.h"

#include <boost/algorithm/hex.hpp>

#include "libUtils/Logger.h"

using namespace std;

namespace {

string::const_iterator SkipHexPrefix(const string& hex_input) {
  if (hex_input.size() >= 2 && hex_input[0] == '0' &&
      (hex_input[1] == 'x' || hex_input[1] == 'X')) {
    return hex_input.begin() + 2;
  }
  return hex_input.begin();
}

}  // namespace

bool DataConversion::HexStrToUint8Vec(const string& hex_input, bytes& out) {
  out.clear();
  try {
    boost::algorithm::unhex(SkipHexPrefix(hex_input), hex_input.end(),
                            back_inserter(out));
  } catch (const boost::algorithm::hex_decode_error& e) {
    LOG_GENERAL(WARNING, "Malformed hex string of length " << hex_input.size());
    out.clear();
    return false;
  }
  return true;
}


bool DataConversion::Uint8VecToHexStr(const bytes& hex_vec, string& str) {
  str.clear();
  str.reserve(hex_vec.size() * 2);
  boost::algorithm::hex_lower(hex_vec.begin(), hex_vec.end(),
                              back_inserter(str));
  return true;
}

string DataConversion::Uint8VecToHexStrRet(const bytes& hex_vec) {
  string str;
  Uint8VecToHexStr(hex_vec, str);
  return str;
}
