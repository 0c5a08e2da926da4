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

#ifndef QKCHASH_SRC_LIBPOW_QKCHASHERRORS_H_
#define QKCHASH_SRC_LIBPOW_QKCHASHERRORS_H_

#include <stdexcept>
#include <string>

namespace qkchash {

/// Invalid cache cardinality or cache contents. Raised before any hashing.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

/// The working cache cannot sustain the removals of one hash computation.
class CapacityError : public std::runtime_error {
 public:
  explicit CapacityError(const std::string& what) : std::runtime_error(what) {}
};

/// A hash backend disagrees with the reference implementation.
class EquivalenceError : public std::runtime_error {
 public:
  explicit EquivalenceError(const std::string& what)
      : std::runtime_error(what) {}
};

}  // namespace qkchash

#endif  // QKCHASH_SRC_LIBPOW_QKCHASHERRORS_H_
