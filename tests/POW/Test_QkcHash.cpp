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

#include "libPOW/QkcHash.h"
#include "libPOW/QkcHashErrors.h"
#include "libUtils/DataConversion.h"
#include "libUtils/JoinableFunction.h"
#include "libUtils/Logger.h"

#define BOOST_TEST_MODULE qkchashtest
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

using namespace qkchash;

namespace {

const Cache& DefaultCache() {
  static const Cache cache = Cache::Build(DEFAULT_CACHE_ENTRIES, {});
  return cache;
}

Words DigestWords(const Hash256& hash) {
  return DeserializeWords(bytes(hash.begin(), hash.end()));
}

std::string ToHex(const Hash256& hash) {
  return DataConversion::Uint8VecToHexStrRet(bytes(hash.begin(), hash.end()));
}

}  // namespace

BOOST_AUTO_TEST_SUITE(qkchashtest)

BOOST_AUTO_TEST_CASE(test_empty_header) {
  INIT_STDOUT_LOGGER();

  const auto result = QkcHash({}, {}, DefaultCache());

  const Words expected{11967621512234744254ULL, 11712119753881699857ULL,
                       4190255959603841725ULL, 6654395615551794006ULL};
  BOOST_CHECK(DigestWords(result.mixDigest) == expected);
  BOOST_CHECK_EQUAL(
      ToHex(result.result),
      "bee2c41fce7183e73823dbefa846439817af68d28891f58ce8331cca7a871504");
}

BOOST_AUTO_TEST_CASE(test_hello_world) {
  const auto result = QkcHash(
      DataConversion::StringToCharArray("Hello World!"), {}, DefaultCache());

  const Words expected{12754842531904701011ULL, 8384861435613290118ULL,
                       2739024099562295228ULL, 4448910328080420635ULL};
  BOOST_CHECK(DigestWords(result.mixDigest) == expected);
  BOOST_CHECK_EQUAL(
      ToHex(result.result),
      "992923af6a261ef3f0b7c82b57ab28c055e31021d0d6258f7dcfd9d6195e0c70");
}

BOOST_AUTO_TEST_CASE(test_nonce_is_reversed) {
  // The nonce is appended to the header in reverse byte order
  const bytes header = DataConversion::StringToCharArray("Hello");
  const bytes nonce{0x01, 0x02, 0x03};

  BOOST_CHECK(SeedWords(header, nonce) ==
              Keccak512Words(bytes{'H', 'e', 'l', 'l', 'o', 0x03, 0x02, 0x01}));
  BOOST_CHECK(SeedWords({}, {}) == Keccak512Words({}));
}

BOOST_AUTO_TEST_CASE(test_small_cache_vector) {
  const Cache cache =
      Cache::Build(2048, DataConversion::StringToCharArray("qkc"));
  const auto result =
      QkcHash(DataConversion::StringToCharArray("Hello World!"),
              DataConversion::IntegerToBytes<uint64_t, NONCE_SIZE>(42), cache);

  BOOST_CHECK_EQUAL(
      ToHex(result.mixDigest),
      "5bd03cbae58e566a2308410c1b66e84b2caab15afb04e63b3d71c5c19e79350d");
  BOOST_CHECK_EQUAL(
      ToHex(result.result),
      "ce40ae5df90417d2665ff8f1a009c530bca863be1785b59249771d700b094cdc");
}

BOOST_AUTO_TEST_CASE(test_deterministic) {
  const bytes header = DataConversion::StringToCharArray("determinism");
  const Cache before = DefaultCache();

  const auto first = QkcHash(header, {0x07}, DefaultCache());
  const auto second = QkcHash(header, {0x07}, DefaultCache());
  BOOST_CHECK(first == second);

  // Hashing works on a private copy of the cache
  BOOST_CHECK(DefaultCache() == before);

  BOOST_CHECK(!(QkcHash(header, {0x08}, DefaultCache()) == first));
}

BOOST_AUTO_TEST_CASE(test_concurrent_isolation) {
  const bytes header1 = DataConversion::StringToCharArray("first");
  const bytes header2 = DataConversion::StringToCharArray("second");

  const auto sequential1 = QkcHash(header1, {}, DefaultCache());
  const auto sequential2 = QkcHash(header2, {}, DefaultCache());

  QkcHashResult concurrent1, concurrent2;
  {
    JoinableFunction t1(1, [&]() {
      concurrent1 = QkcHash(header1, {}, DefaultCache());
    });
    JoinableFunction t2(1, [&]() {
      concurrent2 = QkcHash(header2, {}, DefaultCache());
    });
    t1.join();
    t2.join();
  }

  BOOST_CHECK(concurrent1 == sequential1);
  BOOST_CHECK(concurrent2 == sequential2);
}

BOOST_AUTO_TEST_CASE(test_capacity) {
  BOOST_CHECK_EQUAL(REMOVAL_BUDGET, 1024U);

  // A cache that cannot outlast the removals of one computation
  const Cache tooSmall = Cache::Build(REMOVAL_BUDGET - SEED_WORDS, {});
  BOOST_REQUIRE(tooSmall.Size() < REMOVAL_BUDGET);
  BOOST_CHECK_THROW(QkcHash({}, {}, tooSmall), CapacityError);
  BOOST_CHECK_THROW(CheckCapacity(tooSmall), CapacityError);

  BOOST_CHECK_THROW(QkcHash({}, {}, Cache::FromValues({})), CapacityError);
  BOOST_CHECK_THROW(QkcHash({}, {}, Cache::FromValues({1, 2, 3})),
                    CapacityError);

  // Exactly REMOVAL_BUDGET values never run empty
  const Cache justEnough = Cache::Build(REMOVAL_BUDGET, {});
  BOOST_REQUIRE_EQUAL(justEnough.Size(), REMOVAL_BUDGET);
  BOOST_CHECK_NO_THROW(CheckCapacity(justEnough));
  const auto result = QkcHash({}, {}, justEnough);
  BOOST_CHECK_EQUAL(
      ToHex(result.mixDigest),
      "650f5a90e9e7e13e212b2772d486b1dcde3403152b46d68bed6ba9983dad520b");
  BOOST_CHECK_EQUAL(
      ToHex(result.result),
      "0631e67396c1eecd96f8f60dfc744eed3ac887f30373c012b6cccddca600650f");
}

BOOST_AUTO_TEST_SUITE_END()
