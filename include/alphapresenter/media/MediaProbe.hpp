// Repository: AlphaPresenter
// Component: Media Probe
// Purpose: Container duration lookup for track metadata that was stored
//          without a detected duration.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_MEDIA_MEDIA_PROBE_HPP_
#define ALPHAPRESENTER_MEDIA_MEDIA_PROBE_HPP_

#include <cstdint>
#include <functional>
#include <string>

namespace alphapresenter::media {

// Returns: duration in milliseconds, or -1 if the file is missing, unreadable
// or its container does not declare a duration.
using DurationProbeFn = std::function<int64_t(const std::string& path)>;

// FFmpeg-backed probe (libavformat). Opens the container, reads stream info,
// and closes it again. Safe to call from any thread.
int64_t ProbeDurationMs(const std::string& path);

}  // namespace alphapresenter::media

#endif  // ALPHAPRESENTER_MEDIA_MEDIA_PROBE_HPP_
