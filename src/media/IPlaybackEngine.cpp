// Repository: AlphaPresenter
// Component: Playback Engine Interface
// Purpose: String names for engine states and notifications (logging).
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/media/IPlaybackEngine.hpp"

namespace alphapresenter::media {

const char* PlaybackStateToString(PlaybackState state) {
  switch (state) {
    case PlaybackState::kStopped: return "stopped";
    case PlaybackState::kPlaying: return "playing";
    case PlaybackState::kPaused: return "paused";
  }
  return "unknown";
}

const char* NotificationKindToString(EngineNotification::Kind kind) {
  using Kind = EngineNotification::Kind;
  switch (kind) {
    case Kind::kSourceLoaded: return "SOURCE_LOADED";
    case Kind::kEndOfMedia: return "END_OF_MEDIA";
    case Kind::kInvalidMedia: return "INVALID_MEDIA";
    case Kind::kNoMedia: return "NO_MEDIA";
    case Kind::kError: return "ERROR";
    case Kind::kPlaybackStateChanged: return "STATE_CHANGED";
    case Kind::kDurationKnown: return "DURATION_KNOWN";
    case Kind::kPositionChanged: return "POSITION_CHANGED";
  }
  return "UNKNOWN";
}

}  // namespace alphapresenter::media
