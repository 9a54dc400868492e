// Repository: AlphaPresenter
// Component: Presenter Configuration
// Purpose: Environment overlay for PresenterConfig.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/config/PresenterConfig.hpp"

#include <cstdlib>
#include <sstream>

namespace alphapresenter::config {

PresenterConfig PresenterConfig::FromEnvironment() {
  return FromEnvironment([](const char* name) { return std::getenv(name); });
}

PresenterConfig PresenterConfig::FromEnvironment(const EnvLookupFn& lookup) {
  PresenterConfig config;

  if (const char* level = lookup("ALPHAPRESENTER_LOG_LEVEL")) {
    util::LogLevel parsed;
    if (util::ParseLogLevel(level, &parsed)) {
      config.log_level = parsed;
    } else {
      std::ostringstream oss;
      oss << "[PresenterConfig] UNKNOWN_LOG_LEVEL value=" << level
          << " using=" << util::LogLevelToString(config.log_level);
      util::Logger::Warn(oss.str());
    }
  }

  // ALPHAPRESENTER_DEBUG wins over an explicit level.
  if (lookup("ALPHAPRESENTER_DEBUG") != nullptr) {
    config.log_level = util::LogLevel::kDebug;
  }

  if (const char* file = lookup("ALPHAPRESENTER_LOG_FILE")) {
    config.log_file = file;
  }

  if (const char* root = lookup("ALPHAPRESENTER_MEDIA_ROOT")) {
    if (*root != '\0') config.media_root = root;
  }

  return config;
}

bool ApplyLogging(const PresenterConfig& config) {
  util::Logger::SetLevel(config.log_level);
  return util::Logger::SetLogFile(config.log_file);
}

}  // namespace alphapresenter::config
