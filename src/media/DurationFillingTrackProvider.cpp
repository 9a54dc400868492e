// Repository: AlphaPresenter
// Component: Duration-Filling Track Provider
// Purpose: Probe-on-demand detected durations for track metadata.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/media/DurationFillingTrackProvider.hpp"

#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::media {

DurationFillingTrackProvider::DurationFillingTrackProvider(
    const model::ITrackMetadataProvider* inner,
    const model::IMediaLocator* locator,
    DurationProbeFn probe_fn)
    : inner_(inner), locator_(locator), probe_fn_(std::move(probe_fn)) {}

std::optional<model::TrackMetadata> DurationFillingTrackProvider::LoadTrackMetadata(
    const std::string& track_name) const {
  std::optional<model::TrackMetadata> metadata = inner_->LoadTrackMetadata(track_name);
  if (!metadata || metadata->detected_duration_ms.has_value()) return metadata;
  if (!locator_->Exists(metadata->file_path)) return metadata;

  const std::string path = locator_->Resolve(metadata->file_path);

  int64_t duration_ms = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = probed_ms_.find(path);
    if (it != probed_ms_.end()) {
      duration_ms = it->second;
    } else {
      duration_ms = probe_fn_(path);
      probed_ms_.emplace(path, duration_ms);
      ++probe_count_;
    }
  }

  if (duration_ms > 0) {
    metadata->detected_duration_ms = duration_ms;
    std::ostringstream oss;
    oss << "[DurationFillingTrackProvider] DURATION_FILLED track=" << track_name
        << " duration_ms=" << duration_ms;
    util::Logger::Debug(oss.str());
  }
  return metadata;
}

size_t DurationFillingTrackProvider::probe_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return probe_count_;
}

}  // namespace alphapresenter::media
