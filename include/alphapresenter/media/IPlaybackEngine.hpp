// Repository: AlphaPresenter
// Component: Playback Engine Interface
// Purpose: Opaque single-source media player capability each audio player
//          drives. Backends live outside the core.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_MEDIA_IPLAYBACK_ENGINE_HPP_
#define ALPHAPRESENTER_MEDIA_IPLAYBACK_ENGINE_HPP_

#include <cstdint>
#include <functional>
#include <string>

namespace alphapresenter::media {

enum class PlaybackState {
  kStopped,
  kPlaying,
  kPaused,
};

const char* PlaybackStateToString(PlaybackState state);

struct EngineNotification {
  enum class Kind {
    kSourceLoaded,
    kEndOfMedia,
    kInvalidMedia,
    kNoMedia,
    kError,
    kPlaybackStateChanged,
    kDurationKnown,
    kPositionChanged,
  };

  Kind kind = Kind::kNoMedia;

  // Token passed to the SetSource() call this notification belongs to.
  uint64_t load_token = 0;

  // kPlaybackStateChanged only.
  PlaybackState state = PlaybackState::kStopped;

  // kDurationKnown: duration. kPositionChanged: position.
  int64_t value_ms = 0;

  // kError / kInvalidMedia detail.
  std::string message;
};

const char* NotificationKindToString(EngineNotification::Kind kind);

// =============================================================================
// IPlaybackEngine
//
// Contract:
//   - Notifications are delivered on the EventLoop thread, possibly
//     synchronously from inside a command (e.g. Stop() reporting kStopped).
//   - Every notification carries the load_token of the SetSource() call it
//     relates to, so a player can discard notifications for superseded loads.
//   - Seek() is only valid after kSourceLoaded for the current source.
// =============================================================================

class IPlaybackEngine {
 public:
  using NotificationFn = std::function<void(const EngineNotification&)>;

  virtual ~IPlaybackEngine() = default;

  virtual void SetNotificationCallback(NotificationFn callback) = 0;

  // Empty uri clears the current source.
  virtual void SetSource(const std::string& uri, uint64_t load_token) = 0;

  virtual void Play() = 0;
  virtual void Pause() = 0;
  virtual void Stop() = 0;
  virtual void Seek(int64_t position_ms) = 0;

  virtual int64_t PositionMs() const = 0;
  virtual bool IsSeekable() const = 0;

  // 0.0 .. 1.0
  virtual void SetVolume(float volume) = 0;
};

}  // namespace alphapresenter::media

#endif  // ALPHAPRESENTER_MEDIA_IPLAYBACK_ENGINE_HPP_
