// Repository: AlphaPresenter
// Component: Voice-Over Player
// Purpose: Single-track, fire-and-forget narration playback independent of
//          programs and slide lifecycle.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_AUDIO_VOICE_OVER_PLAYER_HPP_
#define ALPHAPRESENTER_AUDIO_VOICE_OVER_PLAYER_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "alphapresenter/media/IPlaybackEngine.hpp"
#include "alphapresenter/model/MetadataProviders.hpp"

namespace alphapresenter::audio {

class VoiceOverPlayer {
 public:
  enum class State {
    kIdle = 0,
    kLoading = 1,
    kPlaying = 2,
    kStopping = 3,
  };

  struct Callbacks {
    std::function<void(const std::string& track_name)> on_finished;
    std::function<void(const std::string& message)> on_error;
  };

  VoiceOverPlayer(media::IPlaybackEngine* engine,
                  model::Catalog catalog,
                  float default_volume,
                  float neutral_volume);
  ~VoiceOverPlayer();

  VoiceOverPlayer(const VoiceOverPlayer&) = delete;
  VoiceOverPlayer& operator=(const VoiceOverPlayer&) = delete;

  void SetCallbacks(Callbacks callbacks);

  // Tears down any current clip first. Returns false and reports on_error if
  // the track or its media cannot be found.
  bool Play(const std::string& track_name,
            std::optional<float> volume = std::nullopt,
            int64_t start_offset_ms = 0);

  // Idempotent. Never emits on_finished.
  void Stop();

  State state() const { return state_; }
  bool IsPlaying() const { return state_ == State::kLoading || state_ == State::kPlaying; }
  const std::string& track_name() const { return track_name_; }

 private:
  void OnEngineNotification(const media::EngineNotification& notification);
  void Fail(const std::string& message);

  media::IPlaybackEngine* engine_;
  model::Catalog catalog_;
  Callbacks callbacks_;
  const float default_volume_;
  const float neutral_volume_;

  State state_ = State::kIdle;
  std::string track_name_;
  int64_t start_offset_ms_ = 0;
  uint64_t generation_ = 0;
};

}  // namespace alphapresenter::audio

#endif  // ALPHAPRESENTER_AUDIO_VOICE_OVER_PLAYER_HPP_
