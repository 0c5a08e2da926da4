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
#include "Constants.h"

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

using namespace std;

using boost::property_tree::ptree;

struct PTree {
  static const ptree& GetInstance() {
    static const ptree pt = [] {
      ptree tree;
      read_xml(CONSTANTS_FILE, tree);
      return tree;
    }();

    return pt;
  }
  PTree() = delete;
  ~PTree() = delete;
};

unsigned int ReadConstantNumeric(const string& propertyName,
                                 const char* path = "node.pow.") {
  const auto& pt = PTree::GetInstance();
  return pt.get<unsigned int>(path + propertyName);
}

string ReadConstantString(const string& propertyName,
                          const char* path = "node.pow.") {
  const auto& pt = PTree::GetInstance();
  return pt.get<string>(path + propertyName);
}

// Logging constants
const unsigned int MAX_LOG_FILE_SIZE_KB{
    ReadConstantNumeric("MAX_LOG_FILE_SIZE_KB", "node.logging.")};
const unsigned int MAX_ARCHIVED_LOG_COUNT{
    ReadConstantNumeric("MAX_ARCHIVED_LOG_COUNT", "node.logging.")};

// PoW constants
const unsigned int CACHE_ENTRIES{
    ReadConstantNumeric("CACHE_ENTRIES", "node.pow.")};
const unsigned int BUILD_CACHE_THREADS{
    ReadConstantNumeric("BUILD_CACHE_THREADS", "node.pow.")};
const unsigned int NUM_MINING_THREADS{
    ReadConstantNumeric("NUM_MINING_THREADS", "node.pow.")};
const unsigned int POW_WINDOW_IN_SECONDS{
    ReadConstantNumeric("POW_WINDOW_IN_SECONDS", "node.pow.")};
const string POW_BACKEND{ReadConstantString("POW_BACKEND", "node.pow.")};

// Benchmark and audit constants
const unsigned int BENCHMARK_NUM_HASHES{
    ReadConstantNumeric("BENCHMARK_NUM_HASHES", "node.benchmark.")};
const unsigned int BENCHMARK_PROGRESS_STEPS{
    ReadConstantNumeric("BENCHMARK_PROGRESS_STEPS", "node.benchmark.")};
const unsigned int EQUIVALENCE_AUDIT_SAMPLES{
    ReadConstantNumeric("EQUIVALENCE_AUDIT_SAMPLES", "node.benchmark.")};
