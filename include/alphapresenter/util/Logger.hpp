// Repository: AlphaPresenter
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, level-filtered log emission with optional file copy.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_UTIL_LOGGER_HPP_
#define ALPHAPRESENTER_UTIL_LOGGER_HPP_

#include <fstream>
#include <functional>
#include <mutex>
#include <string>

namespace alphapresenter::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelToString(LogLevel level);

// Parses "debug" | "info" | "warn" | "warning" | "error" (case-insensitive).
// Returns false and leaves *out untouched on anything else.
bool ParseLogLevel(const std::string& text, LogLevel* out);

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. The orchestration core is single-threaded, but engine backends
// may log from their own decode threads.
//
// Info  → stdout (normal lifecycle: slide activation, track start)
// Debug → stdout when level is kDebug or ALPHAPRESENTER_DEBUG env is set
// Warn  → stderr (configuration problems, per-track playback errors)
// Error → stderr (hard faults)
//
// When a log file is set, every emitted line is appended to it as well.
//
// Test-only: the sinks receive every line of their severity that passes the
// level filter, in addition to the console.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetLevel(LogLevel level);
  static LogLevel GetLevel();

  // Appends to `path`. Empty path closes the current file.
  // Returns false if the file could not be opened.
  static bool SetLogFile(const std::string& path);

  // Test-only: call with nullptr to clear.
  static void SetDebugSink(Sink sink);
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static void Emit(LogLevel level, const std::string& line);

  static std::mutex mutex_;
  static LogLevel level_;
  static std::ofstream file_;
  static Sink debug_sink_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace alphapresenter::util

#endif  // ALPHAPRESENTER_UTIL_LOGGER_HPP_
