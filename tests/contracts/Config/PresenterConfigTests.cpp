// Repository: AlphaPresenter
// Component: Presenter Configuration Tests
// Purpose: Defaults and ALPHAPRESENTER_* environment overlay.
// Copyright (c) 2025 AlphaPresenter

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "alphapresenter/config/PresenterConfig.hpp"

namespace alphapresenter::config::testing {
namespace {

using util::LogLevel;

PresenterConfig::EnvLookupFn FakeEnv(const std::map<std::string, std::string>& vars) {
  return [vars](const char* name) -> const char* {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  };
}

TEST(PresenterConfigTest, DefaultsWithEmptyEnvironment) {
  PresenterConfig config = PresenterConfig::FromEnvironment(FakeEnv({}));
  EXPECT_EQ(config.log_level, LogLevel::kInfo);
  EXPECT_TRUE(config.log_file.empty());
  EXPECT_EQ(config.media_root, kDefaultMediaRoot);
  EXPECT_FLOAT_EQ(config.neutral_volume, 1.0f);
  EXPECT_FLOAT_EQ(config.default_voice_over_volume, 1.0f);
}

TEST(PresenterConfigTest, EnvironmentOverridesDefaults) {
  PresenterConfig config = PresenterConfig::FromEnvironment(FakeEnv({
      {"ALPHAPRESENTER_LOG_LEVEL", "Warning"},
      {"ALPHAPRESENTER_LOG_FILE", "/tmp/alphapresenter-test.log"},
      {"ALPHAPRESENTER_MEDIA_ROOT", "/srv/show/media"},
  }));
  EXPECT_EQ(config.log_level, LogLevel::kWarn);
  EXPECT_EQ(config.log_file, "/tmp/alphapresenter-test.log");
  EXPECT_EQ(config.media_root, "/srv/show/media");
}

TEST(PresenterConfigTest, UnknownLevelKeepsDefault) {
  PresenterConfig config =
      PresenterConfig::FromEnvironment(FakeEnv({{"ALPHAPRESENTER_LOG_LEVEL", "chatty"}}));
  EXPECT_EQ(config.log_level, LogLevel::kInfo);
}

TEST(PresenterConfigTest, DebugFlagWinsOverLevel) {
  PresenterConfig config = PresenterConfig::FromEnvironment(FakeEnv({
      {"ALPHAPRESENTER_LOG_LEVEL", "error"},
      {"ALPHAPRESENTER_DEBUG", "1"},
  }));
  EXPECT_EQ(config.log_level, LogLevel::kDebug);
}

TEST(PresenterConfigTest, EmptyMediaRootIsIgnored) {
  PresenterConfig config =
      PresenterConfig::FromEnvironment(FakeEnv({{"ALPHAPRESENTER_MEDIA_ROOT", ""}}));
  EXPECT_EQ(config.media_root, kDefaultMediaRoot);
}

TEST(PresenterConfigTest, ApplyLoggingReportsUnopenableFile) {
  const LogLevel saved = util::Logger::GetLevel();

  PresenterConfig config;
  config.log_level = LogLevel::kError;
  config.log_file = "/nonexistent-dir/alphapresenter/x.log";
  EXPECT_FALSE(ApplyLogging(config));
  EXPECT_EQ(util::Logger::GetLevel(), LogLevel::kError);

  config.log_file.clear();
  EXPECT_TRUE(ApplyLogging(config));

  util::Logger::SetLevel(saved);
}

}  // namespace
}  // namespace alphapresenter::config::testing
