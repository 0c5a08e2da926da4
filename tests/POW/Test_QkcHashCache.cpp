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

#include <algorithm>
#include <functional>

#include "libPOW/QkcHashCache.h"
#include "libPOW/QkcHashErrors.h"
#include "libPOW/QkcHashWords.h"
#include "libUtils/DataConversion.h"
#include "libUtils/Logger.h"

#define BOOST_TEST_MODULE qkchashcache
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

using namespace qkchash;

BOOST_AUTO_TEST_SUITE(qkchashcache)

BOOST_AUTO_TEST_CASE(test_single_block) {
  INIT_STDOUT_LOGGER();

  // One block holds the words of keccak512(be32(0)), in ascending order
  const Cache cache = Cache::Build(SEED_WORDS, {});
  const Words expected{3715804851543187064ULL,  5364336187207910090ULL,
                       7379046318072687082ULL,  7661323588995805723ULL,
                       11276912669283011152ULL, 13421542356694655361ULL,
                       16502819931451049325ULL, 16884632442761652022ULL};
  BOOST_CHECK(cache.Values() == expected);

  Words blockWords = Keccak512Words(bytes{0x00, 0x00, 0x00, 0x00});
  std::sort(blockWords.begin(), blockWords.end());
  BOOST_CHECK(cache.Values() == blockWords);
}

BOOST_AUTO_TEST_CASE(test_default_cache) {
  const Cache cache = Cache::Build(DEFAULT_CACHE_ENTRIES, {});

  BOOST_CHECK_EQUAL(cache.Size(), 65536U);
  BOOST_CHECK_EQUAL(cache[0], 71869947341538ULL);
  BOOST_CHECK_EQUAL(cache[1000], 289242875484218414ULL);
  BOOST_CHECK_EQUAL(cache[cache.Size() - 1], 18446404107761626675ULL);

  BOOST_CHECK(std::adjacent_find(cache.Values().begin(), cache.Values().end(),
                                 std::greater_equal<uint64_t>()) ==
              cache.Values().end());
}

BOOST_AUTO_TEST_CASE(test_reproducible) {
  const bytes seed = DataConversion::StringToCharArray("epoch seed");

  const Cache first = Cache::Build(1024, seed);
  const Cache second = Cache::Build(1024, seed);
  BOOST_CHECK(first == second);

  const Cache other = Cache::Build(1024, DataConversion::StringToCharArray(
                                             "another epoch seed"));
  BOOST_CHECK(!(first == other));
}

BOOST_AUTO_TEST_CASE(test_parallel_build) {
  const bytes seed = DataConversion::StringToCharArray("parallel");

  const Cache serial = Cache::Build(4096, seed, 1);
  for (unsigned int threads : {2U, 3U, 8U}) {
    BOOST_CHECK_MESSAGE(Cache::Build(4096, seed, threads) == serial,
                        "Cache differs with " << threads << " threads");
  }

  // More threads than blocks
  BOOST_CHECK(Cache::Build(16, seed, 8) == Cache::Build(16, seed, 1));
}

BOOST_AUTO_TEST_CASE(test_invalid_entries) {
  BOOST_CHECK_THROW(Cache::Build(0, {}), ConfigurationError);
  BOOST_CHECK_THROW(Cache::Build(7, {}), ConfigurationError);
  BOOST_CHECK_THROW(Cache::Build(65537, {}), ConfigurationError);
  BOOST_CHECK_THROW(Cache::CheckEntries((1ULL << 35) + SEED_WORDS),
                    ConfigurationError);

  BOOST_CHECK_NO_THROW(Cache::CheckEntries(1ULL << 35));
  BOOST_CHECK_NO_THROW(Cache::CheckEntries(SEED_WORDS));
}

BOOST_AUTO_TEST_CASE(test_from_values) {
  const Cache cache = Cache::FromValues({1, 5, 9});
  BOOST_CHECK_EQUAL(cache.Size(), 3U);
  BOOST_CHECK(cache.Values() == (Words{1, 5, 9}));

  BOOST_CHECK_EQUAL(Cache::FromValues({}).Size(), 0U);

  BOOST_CHECK_THROW(Cache::FromValues({1, 1, 2}), ConfigurationError);
  BOOST_CHECK_THROW(Cache::FromValues({3, 2}), ConfigurationError);

  const Cache built = Cache::Build(64, {});
  BOOST_CHECK(Cache::FromValues(built.Values()) == built);
}

BOOST_AUTO_TEST_SUITE_END()
