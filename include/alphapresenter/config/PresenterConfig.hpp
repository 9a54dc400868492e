// Repository: AlphaPresenter
// Component: Presenter Configuration
// Purpose: Runtime settings for logging, media lookup and default volumes.
//          Defaults are overlaid by ALPHAPRESENTER_* environment variables.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_CONFIG_PRESENTER_CONFIG_HPP_
#define ALPHAPRESENTER_CONFIG_PRESENTER_CONFIG_HPP_

#include <functional>
#include <string>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::config {

inline constexpr const char* kDefaultLogFileName = "alphapresenter.log";
inline constexpr const char* kDefaultMediaRoot = "assets/media";

struct PresenterConfig {
  util::LogLevel log_level = util::LogLevel::kInfo;

  // Empty: console only.
  std::string log_file;

  // Base directory that track and voice-over file names resolve against.
  std::string media_root = kDefaultMediaRoot;

  // Volume every player restores on stop so slide-specific levels never leak.
  float neutral_volume = 1.0f;

  float default_voice_over_volume = 1.0f;

  // Environment lookup is injectable so tests never touch the process env.
  using EnvLookupFn = std::function<const char*(const char* name)>;

  static PresenterConfig FromEnvironment();
  static PresenterConfig FromEnvironment(const EnvLookupFn& lookup);
};

// Pushes log_level and log_file into util::Logger.
// Returns false if the log file could not be opened (console logging continues).
bool ApplyLogging(const PresenterConfig& config);

}  // namespace alphapresenter::config

#endif  // ALPHAPRESENTER_CONFIG_PRESENTER_CONFIG_HPP_
