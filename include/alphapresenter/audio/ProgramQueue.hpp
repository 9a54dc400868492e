// Repository: AlphaPresenter
// Component: Program Queue
// Purpose: Resolves an audio program's entries into the filtered,
//          play-order-sorted queue the program player walks.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_AUDIO_PROGRAM_QUEUE_HPP_
#define ALPHAPRESENTER_AUDIO_PROGRAM_QUEUE_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "alphapresenter/model/MetadataProviders.hpp"
#include "alphapresenter/model/PresentationTypes.hpp"

namespace alphapresenter::audio {

struct QueuedTrack {
  std::string track_name;
  std::string uri;
  int play_order = 0;

  // Seek target once the source has loaded. 0: no seek.
  int64_t start_ms = 0;

  // Position at which the deadline timer ends the track. std::nullopt: no
  // deadline, the track ends on end-of-media.
  std::optional<int64_t> end_ms;

  std::optional<int64_t> effective_duration_ms;
};

struct TrackRejection {
  std::string track_name;
  model::ConfigError reason;
  std::string detail;
};

struct ProgramQueue {
  std::vector<QueuedTrack> tracks;
  std::vector<TrackRejection> rejected;
};

// Effective duration:
//   user end known           → end − start (end clamped to a known detected duration)
//   else detected known      → detected − start
//   else                     → unknown (kept; plays to natural end)
// Entries with missing metadata, missing media or a non-positive effective
// duration are rejected with a warning. Sorting is stable on play_order.
ProgramQueue BuildProgramQueue(const model::AudioProgram& program,
                               const model::ITrackMetadataProvider& tracks,
                               const model::IMediaLocator& locator);

// Planned length of the whole program including loop repeats.
// std::nullopt when looping is indefinite or any effective duration is unknown.
std::optional<int64_t> TotalProgramDurationMs(const std::vector<QueuedTrack>& queue,
                                              const model::AudioProgram& program);

}  // namespace alphapresenter::audio

#endif  // ALPHAPRESENTER_AUDIO_PROGRAM_QUEUE_HPP_
