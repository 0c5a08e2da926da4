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

#ifndef QKCHASH_SRC_LIBUTILS_LOGGER_H_
#define QKCHASH_SRC_LIBUTILS_LOGGER_H_

#include "common/BaseType.h"
#include "common/Constants.h"

#include <g3log/g3log.hpp>
#include <g3log/logworker.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

/// Process-wide front end of g3log. Sinks are added once at startup.
class Logger {
  std::unique_ptr<g3::LogWorker> m_logWorker;

  Logger();

 public:
  /// Limits the number of bytes of a payload to display.
  static const size_t MAX_BYTES_TO_DISPLAY = 30;

  /// Width of the file:line column.
  static const size_t MAX_FILEANDLINE_LEN = 20;

  /// Width of the function column.
  static const size_t MAX_FUNCNAME_LEN = 20;

  static Logger& GetLogger();

  /**
   * @brief Adds a size-rotated file sink writing <filePrefix>.log.
   *
   * filePath is created if missing. If it cannot be created or written,
   * the current directory is used instead.
   */
  void AddGeneralSink(const std::string& filePrefix,
                      const std::filesystem::path& filePath,
                      int maxLogFileSizeKB = MAX_LOG_FILE_SIZE_KB,
                      int maxArchivedLogCount = MAX_ARCHIVED_LOG_COUNT);

  void AddStdoutSink();

  /// Displays messages of this level and above. Only INFO, WARNING and
  /// FATAL are accepted.
  void DisplayLevelAbove(const LEVELS& level = INFO);

  /// Upper-case hex of at most max_bytes_to_display leading bytes.
  static std::string GetPayloadS(const bytes& payload,
                                 size_t max_bytes_to_display);

  /// Logs BEG on construction and END with the elapsed time on destruction.
  class ScopeMarker final {
   public:
    ScopeMarker(const char* file, int line, const char* func);
    ~ScopeMarker();

    ScopeMarker(const ScopeMarker&) = delete;
    ScopeMarker& operator=(const ScopeMarker&) = delete;

   private:
    const char* m_file;
    int m_line;
    const char* m_func;
    std::chrono::steady_clock::time_point m_start;
  };
};

#define INIT_FILE_LOGGER(filePrefix, filePath) \
  Logger::GetLogger().AddGeneralSink(filePrefix, filePath);

#define INIT_STDOUT_LOGGER() Logger::GetLogger().AddStdoutSink();

#define LOG_GENERAL(level, msg) \
  { LOG(level) << ' ' << msg; }

#define LOG_MARKER() \
  Logger::ScopeMarker marker{__FILE__, __LINE__, __FUNCTION__};

#define LOG_PAYLOAD(level, msg, payload, max_bytes_to_display)            \
  {                                                                       \
    LOG(level) << ' ' << msg << " (Len=" << (payload).size() << "): "    \
               << Logger::GetPayloadS(payload, max_bytes_to_display)     \
               << (((payload).size() > max_bytes_to_display) ? "..." : ""); \
  }

#define LOG_DISPLAY_LEVEL_ABOVE(level) \
  { Logger::GetLogger().DisplayLevelAbove(level); }

#define LOG_CHECK_FAIL(checktype, received, expected) \
  LOG_GENERAL(WARNING, checktype << " check failed"); \
  LOG_GENERAL(WARNING, " Received = " << received);   \
  LOG_GENERAL(WARNING, " Expected = " << expected);

#endif  // QKCHASH_SRC_LIBUTILS_LOGGER_H_
