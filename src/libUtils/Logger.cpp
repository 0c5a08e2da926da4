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

#include "Logger.h"

#include <g3sinks/LogRotate.h>
#include <boost/algorithm/hex.hpp>

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

using namespace std;
using namespace g3;

namespace {

// Keeps the tail of s, where file names and line numbers differ
string Tail(const string& s, size_t len) {
  return s.size() > len ? s.substr(s.size() - len) : s;
}

// [LEVL][thread][timestamp][file:line][function] message
string FormatLine(const LogMessage& message) {
  ostringstream line;
  line << '[' << message.level().substr(0, 4) << "][" << setw(5)
       << message.threadID() << "][" << message.timestamp("%y-%m-%dT%T.%f3")
       << "][" << left << setw(Logger::MAX_FILEANDLINE_LEN)
       << Tail(message.file() + ':' + message.line(),
               Logger::MAX_FILEANDLINE_LEN)
       << "][" << setw(Logger::MAX_FUNCNAME_LEN)
       << message.function().substr(0, Logger::MAX_FUNCNAME_LEN) << ']'
       << message.message() << '\n';
  return line.str();
}

class RotatingFileSink {
 public:
  RotatingFileSink(const string& prefix, const string& directory)
      : m_logRotate(prefix, directory) {}

  void setLimits(int maxLogSizeBytes, int maxArchiveLogCount) {
    m_logRotate.setMaxLogSize(maxLogSizeBytes);
    m_logRotate.setMaxArchiveLogCount(maxArchiveLogCount);
  }

  void receiveLogMessage(LogMessageMover logEntry) {
    m_logRotate.save(FormatLine(logEntry.get()));
  }

 private:
  LogRotate m_logRotate;
};

class StdoutSink {
 public:
  void receiveLogMessage(LogMessageMover logEntry) {
    cout << FormatLine(logEntry.get()) << flush;
  }
};

// Falls back to the working directory if path is unusable
filesystem::path PrepareLogDirectory(const filesystem::path& path) {
  auto directory = filesystem::absolute(path);

  error_code ec;
  filesystem::create_directories(directory, ec);
  if (!ec) {
    const auto perms = filesystem::status(directory, ec).permissions();
    if (!ec && (perms & filesystem::perms::owner_write) !=
                   filesystem::perms::none) {
      return directory;
    }
  }

  cerr << "Cannot log to " << directory
       << (ec ? ", error: " + ec.message() : ", not writable")
       << ". Logging to the working directory instead." << endl;
  return filesystem::absolute(".");
}

}  // namespace

Logger::Logger() : m_logWorker{LogWorker::createLogWorker()} {
  initializeLogging(m_logWorker.get());
}

Logger& Logger::GetLogger() {
  static Logger logger;
  return logger;
}

void Logger::AddGeneralSink(const string& filePrefix,
                            const filesystem::path& filePath,
                            int maxLogFileSizeKB, int maxArchivedLogCount) {
  const auto directory = PrepareLogDirectory(filePath);

  auto sinkHandle = m_logWorker->addSink(
      make_unique<RotatingFileSink>(
          filePrefix.empty() ? "qkchash" : filePrefix, directory.string()),
      &RotatingFileSink::receiveLogMessage);
  sinkHandle
      ->call(&RotatingFileSink::setLimits, maxLogFileSizeKB * 1024,
             maxArchivedLogCount)
      .wait();
}

void Logger::AddStdoutSink() {
  m_logWorker->addSink(make_unique<StdoutSink>(),
                       &StdoutSink::receiveLogMessage);
}

void Logger::DisplayLevelAbove(const LEVELS& level) {
  if (level != INFO && level != WARNING && level != FATAL) return;

  log_levels::setHighest(level);
}

string Logger::GetPayloadS(const bytes& payload, size_t max_bytes_to_display) {
  string res;
  const size_t len = min(payload.size(), max_bytes_to_display);
  boost::algorithm::hex(payload.begin(), payload.begin() + len,
                        back_inserter(res));
  return res;
}

Logger::ScopeMarker::ScopeMarker(const char* file, int line, const char* func)
    : m_file{file},
      m_line{line},
      m_func{func},
      m_start{chrono::steady_clock::now()} {
  LogCapture(m_file, m_line, m_func, INFO).stream() << " BEG";
}

Logger::ScopeMarker::~ScopeMarker() {
  const auto elapsedUs = chrono::duration_cast<chrono::microseconds>(
                             chrono::steady_clock::now() - m_start)
                             .count();
  LogCapture(m_file, m_line, m_func, INFO).stream()
      << " END (" << elapsedUs << " us)";
}
