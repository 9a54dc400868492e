// Repository: AlphaPresenter
// Component: Audio Program Player
// Purpose: Plays an audio program's queue back-to-back on one playback engine,
//          honoring per-track trims and program-level looping.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_AUDIO_AUDIO_PROGRAM_PLAYER_HPP_
#define ALPHAPRESENTER_AUDIO_AUDIO_PROGRAM_PLAYER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "alphapresenter/audio/ProgramQueue.hpp"
#include "alphapresenter/media/IPlaybackEngine.hpp"
#include "alphapresenter/model/MetadataProviders.hpp"
#include "alphapresenter/model/PresentationTypes.hpp"
#include "alphapresenter/runtime/EventLoop.hpp"
#include "alphapresenter/runtime/OneShotTimer.hpp"

namespace alphapresenter::audio {

// =============================================================================
// AudioProgramPlayer
//
//   Idle ──Play──► Loading(i) ──source loaded, seek, play──► Playing(i)
//                     ▲                                          │
//                     └──── next turn ◄── end-of-media / error / deadline
//
// After the last track: loop_indefinitely restarts at 0; otherwise a positive
// loop count is decremented and restarts at 0; otherwise the player stops and
// reports program finished.
//
// Every SetSource() carries the current generation as its load token. Track
// changes, Stop() and the deadline all bump the generation, so a notification
// or timer belonging to a superseded track is dropped. While Stop() runs the
// state is kStopping and every notification is dropped, which covers engines
// that report synchronously from inside Stop().
//
// Track errors never stop the program: the player reports them and advances.
// Advances always go through a zero-delay timer, so a run of failing tracks
// drains one per loop turn instead of recursing.
// =============================================================================

class AudioProgramPlayer {
 public:
  enum class State {
    kIdle = 0,
    kLoading = 1,
    kPlaying = 2,
    kPaused = 3,
    kStopping = 4,
  };

  struct LoadResult {
    bool ok;
    model::ConfigError error;
    std::string detail;
    size_t playable_tracks;

    static LoadResult Success(size_t playable) {
      return {true, model::ConfigError::kNone, "", playable};
    }

    static LoadResult Failure(model::ConfigError err, const std::string& detail = "") {
      return {false, err, detail, 0};
    }
  };

  struct Callbacks {
    std::function<void(size_t index, const std::string& track_name)> on_track_changed;
    std::function<void()> on_program_finished;
    std::function<void(const std::string& message)> on_error;
  };

  AudioProgramPlayer(runtime::EventLoop* loop,
                     media::IPlaybackEngine* engine,
                     model::Catalog catalog);
  ~AudioProgramPlayer();

  AudioProgramPlayer(const AudioProgramPlayer&) = delete;
  AudioProgramPlayer& operator=(const AudioProgramPlayer&) = delete;

  void SetCallbacks(Callbacks callbacks);

  // Both overloads stop current playback first. An empty queue fails the load
  // and leaves the player with no program.
  LoadResult Load(const std::string& program_name);
  LoadResult Load(const model::AudioProgram& program);

  // Starts the loaded queue from the first track. False if nothing is loaded.
  bool Play();

  bool Pause();
  bool Resume();

  // Idempotent. Cancels the deadline, stops the engine and clears the queue
  // position. The loaded queue is kept so Play() can start it again.
  void Stop();

  // Accepts 0.0 .. 1.0. Out-of-range values are rejected and logged.
  bool SetVolume(float volume);

  State state() const { return state_; }
  bool IsActive() const { return state_ != State::kIdle && state_ != State::kStopping; }
  int current_index() const { return current_index_; }
  const std::vector<QueuedTrack>& queue() const { return queue_; }
  const std::string& program_name() const { return program_.program_name; }
  int completed_passes() const { return completed_passes_; }
  bool HasTrackDeadline() const { return deadline_timer_.IsActive(); }
  float volume() const { return volume_; }

  std::optional<int64_t> TotalDurationMs() const;

 private:
  void StartTrack(size_t index);
  void OnEngineNotification(const media::EngineNotification& notification);
  void OnSourceLoaded();
  void OnPlaybackStateChanged(media::PlaybackState engine_state);
  void ArmTrackDeadline();
  void OnTrackDeadline(uint64_t generation);
  void EndCurrentTrack(const char* reason);
  void AdvanceToNextTrack();
  void FinishProgram();

  media::IPlaybackEngine* engine_;
  model::Catalog catalog_;
  Callbacks callbacks_;

  runtime::OneShotTimer deadline_timer_;
  runtime::OneShotTimer advance_timer_;

  model::AudioProgram program_;
  std::vector<QueuedTrack> queue_;

  State state_ = State::kIdle;
  int current_index_ = -1;
  int loops_remaining_ = 0;
  int completed_passes_ = 0;
  float volume_ = 1.0f;
  uint64_t generation_ = 0;
};

const char* AudioProgramPlayerStateToString(AudioProgramPlayer::State state);

}  // namespace alphapresenter::audio

#endif  // ALPHAPRESENTER_AUDIO_AUDIO_PROGRAM_PLAYER_HPP_
