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

#include "WorkingCache.h"

#include <algorithm>
#include <stdexcept>
#include <string>

#include "QkcHashCache.h"
#include "QkcHashErrors.h"
#include "libUtils/Logger.h"

using namespace std;

namespace qkchash {

WorkingCache::WorkingCache(const Cache& cache)
    : m_values(cache.Values()),
      m_members(cache.Values().begin(), cache.Values().end()) {}

uint64_t WorkingCache::RemoveAt(size_t index) {
  if (m_values.empty()) {
    LOG_GENERAL(WARNING, "Removal from an empty working cache");
    throw CapacityError("working cache is empty");
  }
  if (index >= m_values.size()) {
    throw out_of_range("working cache index " + to_string(index) +
                       " >= size " + to_string(m_values.size()));
  }

  const auto it = m_values.begin() + index;
  const uint64_t removed = *it;
  m_members.erase(removed);
  m_values.erase(it);
  return removed;
}

bool WorkingCache::Insert(uint64_t value) {
  if (!m_members.insert(value).second) {
    return false;
  }
  m_values.insert(upper_bound(m_values.begin(), m_values.end(), value), value);
  return true;
}

}  // namespace qkchash
