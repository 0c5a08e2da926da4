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

#include "libPOW/QkcHashCache.h"
#include "libPOW/QkcHashErrors.h"
#include "libPOW/WorkingCache.h"
#include "libUtils/Logger.h"

#define BOOST_TEST_MODULE workingcache
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

using namespace qkchash;

BOOST_AUTO_TEST_SUITE(workingcache)

BOOST_AUTO_TEST_CASE(test_remove_insert) {
  INIT_STDOUT_LOGGER();

  const Cache cache = Cache::FromValues({10, 20, 30, 40});
  WorkingCache working(cache);

  BOOST_CHECK_EQUAL(working.Size(), 4U);
  BOOST_CHECK(working.Contains(30));

  BOOST_CHECK_EQUAL(working.RemoveAt(2), 30ULL);
  BOOST_CHECK_EQUAL(working.Size(), 3U);
  BOOST_CHECK(!working.Contains(30));

  // Indices refer to the current, shrunken order
  BOOST_CHECK_EQUAL(working.RemoveAt(2), 40ULL);

  BOOST_CHECK(working.Insert(15));
  BOOST_CHECK(working.Insert(45));
  BOOST_CHECK(working.Values() == (Words{10, 15, 20, 45}));

  BOOST_CHECK(!working.Insert(20));
  BOOST_CHECK(working.Values() == (Words{10, 15, 20, 45}));

  // The source cache is left untouched
  BOOST_CHECK(cache.Values() == (Words{10, 20, 30, 40}));
}

BOOST_AUTO_TEST_CASE(test_boundaries) {
  const Cache cache = Cache::FromValues({7});
  WorkingCache working(cache);

  BOOST_CHECK_THROW(working.RemoveAt(1), std::out_of_range);
  BOOST_CHECK_EQUAL(working.RemoveAt(0), 7ULL);
  BOOST_CHECK(working.Empty());
  BOOST_CHECK_THROW(working.RemoveAt(0), CapacityError);

  BOOST_CHECK(working.Insert(7));
  BOOST_CHECK(working.Contains(7));
  BOOST_CHECK_EQUAL(working.Size(), 1U);
}

BOOST_AUTO_TEST_CASE(test_extremes) {
  const Cache cache = Cache::FromValues({0, 0xFFFFFFFFFFFFFFFFULL});
  WorkingCache working(cache);

  BOOST_CHECK(working.Insert(1));
  BOOST_CHECK(!working.Insert(0));
  BOOST_CHECK(working.Values() == (Words{0, 1, 0xFFFFFFFFFFFFFFFFULL}));
  BOOST_CHECK_EQUAL(working.RemoveAt(0), 0ULL);
  BOOST_CHECK_EQUAL(working.RemoveAt(1), 0xFFFFFFFFFFFFFFFFULL);
}

BOOST_AUTO_TEST_SUITE_END()
