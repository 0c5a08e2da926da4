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

#include "libUtils/DataConversion.h"
#include "libUtils/Logger.h"

#define BOOST_TEST_MODULE data_conversion
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(data_conversion)

BOOST_AUTO_TEST_CASE(test_integer_to_bytes) {
  INIT_STDOUT_LOGGER();

  LOG_GENERAL(INFO, "Test IntegerToBytes start...");

  uint8_t num1 = 0x01, num2 = 0xAB;
  bytes bytesOfNum1 =
      DataConversion::IntegerToBytes<uint8_t, sizeof(uint8_t)>(num1);
  BOOST_REQUIRE(bytesOfNum1 == bytes{num1});

  bytes bytesOfNum2 =
      DataConversion::IntegerToBytes<uint8_t, sizeof(uint8_t)>(num2);
  BOOST_REQUIRE(bytesOfNum2 == bytes{num2});

  {
    uint32_t uint32Num1 = 0x01234567;
    bytes bytesOfUint32Num1 =
        DataConversion::IntegerToBytes<uint32_t, sizeof(uint32_t)>(uint32Num1);
    bytes goldenResult{0x01, 0x23, 0x45, 0x67};
    BOOST_REQUIRE(bytesOfUint32Num1 == goldenResult);
  }

  {
    uint64_t uint64Num1 = 0x01234567;
    bytes bytesOfUint64Num1 =
        DataConversion::IntegerToBytes<uint64_t, sizeof(uint64_t)>(uint64Num1);
    bytes goldenResult{0x00, 0x00, 0x00, 0x00, 0x01, 0x23, 0x45, 0x67};
    BOOST_REQUIRE(bytesOfUint64Num1 == goldenResult);
  }

  // Block indices of the cache derivation are 4 byte big-endian
  bytes blockIndex =
      DataConversion::IntegerToBytes<uint64_t, 4>(0x1122334455667788);
  BOOST_REQUIRE(blockIndex == (bytes{0x55, 0x66, 0x77, 0x88}));

  LOG_GENERAL(INFO, "Test IntegerToBytes done!");
}

BOOST_AUTO_TEST_CASE(test_hexstr) {
  LOG_GENERAL(INFO, "Test HexString Conversion start...");

  const bytes expected{0xfe, 0xeb, 0x20, 0x48, 0xde, 0xad, 0xbe, 0xef};

  for (const std::string& hex_str :
       {"feeb2048deadbeef", "0xfeeb2048deadbeef", "FEEB2048DEADBEEF",
        "0xFeeb2048DeadBeef", "0XFEEB2048DEADBEEF"}) {
    bytes out;
    BOOST_CHECK_MESSAGE(DataConversion::HexStrToUint8Vec(hex_str, out),
                        "Test Failed: " << hex_str);
    BOOST_CHECK_MESSAGE(out == expected, "Test Failed: " << hex_str);
  }

  for (const std::string& hex_str : {"feeb2048deadbee", "0xzz", "feeb 2048"}) {
    bytes out;
    BOOST_CHECK_MESSAGE(!DataConversion::HexStrToUint8Vec(hex_str, out),
                        "Test Failed: " << hex_str);
    BOOST_CHECK_MESSAGE(out.empty(), "Test Failed: " << hex_str);
  }

  bytes empty{0x01};
  BOOST_CHECK(DataConversion::HexStrToUint8Vec("", empty));
  BOOST_CHECK(empty.empty());

  std::string str;
  BOOST_REQUIRE(DataConversion::Uint8VecToHexStr(expected, str));
  BOOST_CHECK_EQUAL(str, "feeb2048deadbeef");
  BOOST_CHECK_EQUAL(DataConversion::Uint8VecToHexStrRet({}), "");
  BOOST_CHECK_EQUAL(DataConversion::Uint8VecToHexStrRet({0x00, 0x0a}), "000a");

  LOG_GENERAL(INFO, "Test HexString Conversion done!");
}

BOOST_AUTO_TEST_CASE(test_std_array) {
  std::array<uint8_t, 4> arr{};
  BOOST_REQUIRE(DataConversion::HexStrToStdArray("0XDEADbeef", arr));
  BOOST_CHECK(arr == (std::array<uint8_t, 4>{0xde, 0xad, 0xbe, 0xef}));
  BOOST_CHECK_EQUAL(DataConversion::StdArrayToHexStr(arr), "deadbeef");

  // Wrong sizes leave the array untouched
  BOOST_CHECK(!DataConversion::HexStrToStdArray("deadbe", arr));
  BOOST_CHECK(!DataConversion::HexStrToStdArray("deadbeef00", arr));
  BOOST_CHECK(!DataConversion::HexStrToStdArray("deadbeeg", arr));
  BOOST_CHECK_EQUAL(DataConversion::StdArrayToHexStr(arr), "deadbeef");
}

BOOST_AUTO_TEST_CASE(test_string_to_char_array) {
  BOOST_CHECK(DataConversion::StringToCharArray("Hello World!") ==
              (bytes{'H', 'e', 'l', 'l', 'o', ' ', 'W', 'o', 'r', 'l', 'd',
                     '!'}));
  BOOST_CHECK(DataConversion::StringToCharArray("").empty());
}

BOOST_AUTO_TEST_SUITE_END()
