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

#ifndef QKCHASH_SRC_LIBUTILS_SELECT_H_
#define QKCHASH_SRC_LIBUTILS_SELECT_H_

#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @brief Returns the n-th smallest element (0-based) of data.
 *
 * Partition-based selection using the first element of the current range as
 * pivot. Reorders data in place.
 * @throw std::out_of_range if n >= data.size().
 */
template <typename T>
T Select(std::vector<T>& data, size_t n) {
  if (n >= data.size()) {
    throw std::out_of_range("select index out of range");
  }

  size_t left = 0;
  size_t right = data.size();

  while (true) {
    const T pivot = data[left];
    size_t i = left + 1;
    size_t e = right;
    while (i < e) {
      if (pivot < data[i]) {
        e--;
        std::swap(data[e], data[i]);
      } else {
        i++;
      }
    }
    i--;
    data[left] = data[i];
    data[i] = pivot;

    if (i == n) {
      return pivot;
    } else if (n < i) {
      right = i;
    } else {
      left = i + 1;
    }
  }
}

#endif  // QKCHASH_SRC_LIBUTILS_SELECT_H_
