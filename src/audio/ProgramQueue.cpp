// Repository: AlphaPresenter
// Component: Program Queue
// Purpose: Track filtering, trimming and ordering for audio programs.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/audio/ProgramQueue.hpp"

#include <algorithm>
#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::audio {

using model::ConfigError;

namespace {

void Reject(ProgramQueue& queue,
            const model::AudioProgram& program,
            const std::string& track_name,
            ConfigError reason,
            const std::string& detail) {
  std::ostringstream oss;
  oss << "[ProgramQueue] TRACK_SKIPPED program=" << program.program_name
      << " track=" << track_name << " reason=" << model::ConfigErrorToString(reason);
  if (!detail.empty()) oss << " " << detail;
  util::Logger::Warn(oss.str());
  queue.rejected.push_back(TrackRejection{track_name, reason, detail});
}

}  // namespace

ProgramQueue BuildProgramQueue(const model::AudioProgram& program,
                               const model::ITrackMetadataProvider& tracks,
                               const model::IMediaLocator& locator) {
  ProgramQueue queue;

  for (const auto& entry : program.tracks) {
    std::optional<model::TrackMetadata> metadata = tracks.LoadTrackMetadata(entry.track_name);
    if (!metadata) {
      Reject(queue, program, entry.track_name, ConfigError::kTrackMetadataMissing, "");
      continue;
    }

    if (!locator.Exists(metadata->file_path)) {
      Reject(queue, program, entry.track_name, ConfigError::kMediaMissing,
             "file=" + metadata->file_path);
      continue;
    }

    const int64_t start_ms = std::max<int64_t>(0, entry.user_start_time_ms);
    const std::optional<int64_t>& detected = metadata->detected_duration_ms;

    std::optional<int64_t> end_ms = entry.user_end_time_ms;
    if (end_ms && detected && *end_ms > *detected) {
      std::ostringstream oss;
      oss << "[ProgramQueue] END_CLAMPED program=" << program.program_name
          << " track=" << entry.track_name << " user_end_ms=" << *end_ms
          << " detected_ms=" << *detected;
      util::Logger::Warn(oss.str());
      end_ms = detected;
    }
    if (!end_ms) end_ms = detected;

    std::optional<int64_t> effective_ms;
    if (end_ms) effective_ms = *end_ms - start_ms;

    if (effective_ms && *effective_ms <= 0) {
      std::ostringstream detail;
      detail << "start_ms=" << start_ms << " end_ms=" << *end_ms;
      Reject(queue, program, entry.track_name, ConfigError::kNonPositiveDuration,
             detail.str());
      continue;
    }

    QueuedTrack track;
    track.track_name = entry.track_name;
    track.uri = locator.Resolve(metadata->file_path);
    track.play_order = entry.play_order;
    track.start_ms = start_ms;
    track.end_ms = end_ms;
    track.effective_duration_ms = effective_ms;
    queue.tracks.push_back(std::move(track));
  }

  std::stable_sort(queue.tracks.begin(), queue.tracks.end(),
                   [](const QueuedTrack& a, const QueuedTrack& b) {
                     return a.play_order < b.play_order;
                   });
  return queue;
}

std::optional<int64_t> TotalProgramDurationMs(const std::vector<QueuedTrack>& queue,
                                              const model::AudioProgram& program) {
  if (program.loop_indefinitely) return std::nullopt;

  int64_t single_pass_ms = 0;
  for (const auto& track : queue) {
    if (!track.effective_duration_ms) return std::nullopt;
    single_pass_ms += *track.effective_duration_ms;
  }
  const int64_t passes = 1 + std::max(0, program.loop_count);
  return single_pass_ms * passes;
}

}  // namespace alphapresenter::audio
