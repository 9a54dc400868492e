// Repository: AlphaPresenter
// Component: Thread-Safe Logger
// Purpose: Mutex-protected, level-filtered log emission with optional file copy.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

namespace alphapresenter::util {

std::mutex Logger::mutex_;
LogLevel Logger::level_ = LogLevel::kInfo;
std::ofstream Logger::file_;
Logger::Sink Logger::debug_sink_;
Logger::Sink Logger::info_sink_;
Logger::Sink Logger::warn_sink_;
Logger::Sink Logger::error_sink_;

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "debug";
    case LogLevel::kInfo: return "info";
    case LogLevel::kWarn: return "warn";
    case LogLevel::kError: return "error";
  }
  return "unknown";
}

bool ParseLogLevel(const std::string& text, LogLevel* out) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    *out = LogLevel::kDebug;
  } else if (lowered == "info") {
    *out = LogLevel::kInfo;
  } else if (lowered == "warn" || lowered == "warning") {
    *out = LogLevel::kWarn;
  } else if (lowered == "error") {
    *out = LogLevel::kError;
  } else {
    return false;
  }
  return true;
}

void Logger::SetLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
}

LogLevel Logger::GetLevel() {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

bool Logger::SetLogFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.close();
  }
  if (path.empty()) return true;
  file_.open(path, std::ios::out | std::ios::app);
  if (!file_.is_open()) {
    std::cerr << "[Logger] LOG_FILE_OPEN_FAILED path=" << path << '\n';
    std::cerr.flush();
    return false;
  }
  return true;
}

void Logger::SetDebugSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  debug_sink_ = std::move(sink);
}

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line); }

void Logger::Debug(const std::string& line) {
  // The env override lets a single run be made verbose without reconfiguring.
  if (std::getenv("ALPHAPRESENTER_DEBUG") != nullptr) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (debug_sink_) debug_sink_(line);
    std::cout << line << '\n';
    std::cout.flush();
    if (file_.is_open()) {
      file_ << line << '\n';
      file_.flush();
    }
    return;
  }
  Emit(LogLevel::kDebug, line);
}

void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }

void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line); }

void Logger::Emit(LogLevel level, const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (static_cast<int>(level) < static_cast<int>(level_)) return;

  switch (level) {
    case LogLevel::kInfo:
      if (info_sink_) info_sink_(line);
      break;
    case LogLevel::kWarn:
      if (warn_sink_) warn_sink_(line);
      break;
    case LogLevel::kError:
      if (error_sink_) error_sink_(line);
      break;
    case LogLevel::kDebug:
      if (debug_sink_) debug_sink_(line);
      break;
  }

  std::ostream& out = (level >= LogLevel::kWarn) ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();

  if (file_.is_open()) {
    file_ << line << '\n';
    file_.flush();
  }
}

}  // namespace alphapresenter::util
