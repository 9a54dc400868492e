// Repository: AlphaPresenter
// Component: Slide Audio Player
// Purpose: Slide-scoped use of an audio program: intro delay, outro padding,
//          whole-cycle looping and per-slide volume.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_AUDIO_SLIDE_AUDIO_PLAYER_HPP_
#define ALPHAPRESENTER_AUDIO_SLIDE_AUDIO_PLAYER_HPP_

#include <cstdint>
#include <functional>
#include <string>

#include "alphapresenter/audio/AudioProgramPlayer.hpp"
#include "alphapresenter/media/IPlaybackEngine.hpp"
#include "alphapresenter/model/MetadataProviders.hpp"
#include "alphapresenter/model/PresentationTypes.hpp"
#include "alphapresenter/runtime/EventLoop.hpp"
#include "alphapresenter/runtime/OneShotTimer.hpp"

namespace alphapresenter::audio {

// Stopped → IntroWait → ProgramRunning → OutroWait → (loop: IntroWait | Stopped)
//
// Intro and outro are silent. A looping slide replays the whole
// intro/program/outro cycle, not just the tracks.
class SlideAudioPlayer {
 public:
  enum class Phase {
    kStopped = 0,
    kIntroWait = 1,
    kProgramRunning = 2,
    kOutroWait = 3,
  };

  struct Callbacks {
    // Cycle completed without looping. Informational only.
    std::function<void()> on_audio_finished;
    std::function<void(const std::string& message)> on_error;
  };

  SlideAudioPlayer(runtime::EventLoop* loop,
                   media::IPlaybackEngine* engine,
                   model::Catalog catalog,
                   float neutral_volume);
  ~SlideAudioPlayer();

  SlideAudioPlayer(const SlideAudioPlayer&) = delete;
  SlideAudioPlayer& operator=(const SlideAudioPlayer&) = delete;

  void SetCallbacks(Callbacks callbacks);

  // Stops whatever was playing, loads the named program and starts the first
  // cycle. Returns false (audio absent) if no program is named or it has no
  // playable tracks.
  bool LoadAndPlay(const model::SlideAudioSettings& settings);

  // Idempotent and safe to call from inside any callback.
  void Stop();

  // True while intro is pending, the program plays, or outro is pending.
  bool IsAudioActive() const { return phase_ != Phase::kStopped; }

  Phase phase() const { return phase_; }
  int cycles_started() const { return cycles_started_; }
  const AudioProgramPlayer& program_player() const { return program_player_; }

 private:
  void StartCycle();
  void StartProgram(uint64_t generation);
  void OnProgramFinished();
  void OnOutroElapsed(uint64_t generation);

  AudioProgramPlayer program_player_;
  runtime::OneShotTimer intro_timer_;
  runtime::OneShotTimer outro_timer_;
  Callbacks callbacks_;

  const float neutral_volume_;
  model::SlideAudioSettings settings_;
  Phase phase_ = Phase::kStopped;
  bool loaded_ = false;
  bool stopping_ = false;
  int cycles_started_ = 0;
  uint64_t generation_ = 0;
};

const char* SlideAudioPhaseToString(SlideAudioPlayer::Phase phase);

}  // namespace alphapresenter::audio

#endif  // ALPHAPRESENTER_AUDIO_SLIDE_AUDIO_PLAYER_HPP_
