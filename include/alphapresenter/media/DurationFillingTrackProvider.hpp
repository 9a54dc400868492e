// Repository: AlphaPresenter
// Component: Duration-Filling Track Provider
// Purpose: Decorates a track metadata provider so that tracks stored without
//          a detected duration get one from the media probe.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_MEDIA_DURATION_FILLING_TRACK_PROVIDER_HPP_
#define ALPHAPRESENTER_MEDIA_DURATION_FILLING_TRACK_PROVIDER_HPP_

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "alphapresenter/media/MediaProbe.hpp"
#include "alphapresenter/model/MetadataProviders.hpp"

namespace alphapresenter::media {

// Each file is probed at most once; failed probes are cached too, so a
// broken file does not cost a container open on every program load.
class DurationFillingTrackProvider : public model::ITrackMetadataProvider {
 public:
  DurationFillingTrackProvider(const model::ITrackMetadataProvider* inner,
                               const model::IMediaLocator* locator,
                               DurationProbeFn probe_fn);

  std::optional<model::TrackMetadata> LoadTrackMetadata(
      const std::string& track_name) const override;

  size_t probe_count() const;

 private:
  const model::ITrackMetadataProvider* inner_;
  const model::IMediaLocator* locator_;
  DurationProbeFn probe_fn_;

  mutable std::mutex mutex_;
  mutable std::map<std::string, int64_t> probed_ms_;  // resolved path → ms or -1
  mutable size_t probe_count_ = 0;
};

}  // namespace alphapresenter::media

#endif  // ALPHAPRESENTER_MEDIA_DURATION_FILLING_TRACK_PROVIDER_HPP_
