// Repository: AlphaPresenter
// Component: Media Inspect Tool
// Purpose: Diagnostics CLI: probes media durations and previews how subtitle
//          files import as paragraph sentences.
// Copyright (c) 2025 AlphaPresenter
//
// This binary is for authoring and diagnostics only. It exercises the same
// probe, locator and parser code the presenter uses.
//
// MODES OF OPERATION:
// 1. Probe:    --probe FILE [FILE ...]
// 2. Subtitle: --parse-subtitles FILE

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "alphapresenter/config/PresenterConfig.hpp"
#include "alphapresenter/media/MediaLocator.hpp"
#include "alphapresenter/media/MediaProbe.hpp"
#include "alphapresenter/text/SubtitleParser.hpp"
#include "alphapresenter/util/Logger.hpp"

namespace {

using alphapresenter::config::PresenterConfig;
using alphapresenter::util::LogLevel;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFileFailed = 2;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::vector<std::string> probe_paths;
  std::string subtitle_path;
  std::string media_root;
  std::optional<LogLevel> log_level;

  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "AlphaPresenter media and subtitle inspection tool.\n"
            << "\n"
            << "MODES:\n"
            << "  --probe FILE ...          Print the detected duration of each media file\n"
            << "  --parse-subtitles FILE    Print the sentences imported from a .srt/.vtt/.tsv/.txt\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --media-root DIR          Resolve relative media names under DIR\n"
            << "                            (default: $ALPHAPRESENTER_MEDIA_ROOT or assets/media)\n"
            << "  --log-level LEVEL         debug | info | warn | error\n"
            << "  --help                    Show this help message\n"
            << "\n"
            << "EXIT STATUS:\n"
            << "  0 success, 1 usage error, 2 at least one file failed\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--probe") {
      // Collect all paths until the next flag
      while (i + 1 < argc && argv[i + 1][0] != '-') {
        args.probe_paths.push_back(argv[++i]);
      }
      if (args.probe_paths.empty()) {
        args.error = "--probe requires at least one file";
        return args;
      }
    } else if (arg == "--parse-subtitles" && i + 1 < argc) {
      args.subtitle_path = argv[++i];
    } else if (arg == "--media-root" && i + 1 < argc) {
      args.media_root = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      LogLevel level;
      const std::string value = argv[++i];
      if (!alphapresenter::util::ParseLogLevel(value, &level)) {
        args.error = "Invalid --log-level: " + value;
        return args;
      }
      args.log_level = level;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.probe_paths.empty() && args.subtitle_path.empty()) {
    args.error = "Nothing to do: specify --probe or --parse-subtitles";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Modes
// =============================================================================

bool RunProbe(const CliArgs& args, const PresenterConfig& config) {
  alphapresenter::media::MediaLocator locator(config.media_root);
  bool all_ok = true;

  for (const auto& name : args.probe_paths) {
    if (!locator.Exists(name)) {
      std::cout << name << "\tMISSING\t" << locator.Resolve(name) << "\n";
      all_ok = false;
      continue;
    }
    const int64_t duration_ms = alphapresenter::media::ProbeDurationMs(locator.Resolve(name));
    if (duration_ms < 0) {
      std::cout << name << "\tUNKNOWN\n";
      all_ok = false;
      continue;
    }
    std::cout << name << "\t" << duration_ms << " ms\n";
  }
  return all_ok;
}

bool RunSubtitles(const CliArgs& args) {
  const alphapresenter::text::SubtitleFileResult result =
      alphapresenter::text::ParseSubtitleFile(args.subtitle_path);
  if (!result.ok) {
    std::cerr << "Error: " << result.error << "\n";
    return false;
  }

  std::cout << "paragraph: " << result.paragraph.name << "\n";
  int index = 1;
  for (const auto& sentence : result.paragraph.sentences) {
    std::cout << std::setw(4) << index++ << "  " << std::fixed << std::setprecision(1)
              << std::setw(6) << sentence.delay_seconds << "s  " << sentence.text << "\n";
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  PresenterConfig config = PresenterConfig::FromEnvironment();
  if (!args.media_root.empty()) config.media_root = args.media_root;
  if (args.log_level) config.log_level = *args.log_level;
  if (!alphapresenter::config::ApplyLogging(config)) {
    std::cerr << "Warning: cannot open log file " << config.log_file
              << ", logging to console only\n";
  }

  bool ok = true;
  if (!args.probe_paths.empty()) ok = RunProbe(args, config) && ok;
  if (!args.subtitle_path.empty()) ok = RunSubtitles(args) && ok;

  return ok ? kExitOk : kExitFileFailed;
}
