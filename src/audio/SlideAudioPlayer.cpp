// Repository: AlphaPresenter
// Component: Slide Audio Player
// Purpose: Intro/program/outro cycle around an AudioProgramPlayer.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/audio/SlideAudioPlayer.hpp"

#include <algorithm>
#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::audio {

const char* SlideAudioPhaseToString(SlideAudioPlayer::Phase phase) {
  switch (phase) {
    case SlideAudioPlayer::Phase::kStopped: return "stopped";
    case SlideAudioPlayer::Phase::kIntroWait: return "intro_wait";
    case SlideAudioPlayer::Phase::kProgramRunning: return "program_running";
    case SlideAudioPlayer::Phase::kOutroWait: return "outro_wait";
  }
  return "unknown";
}

SlideAudioPlayer::SlideAudioPlayer(runtime::EventLoop* loop,
                                   media::IPlaybackEngine* engine,
                                   model::Catalog catalog,
                                   float neutral_volume)
    : program_player_(loop, engine, catalog),
      intro_timer_(loop),
      outro_timer_(loop),
      neutral_volume_(neutral_volume) {
  AudioProgramPlayer::Callbacks cb;
  cb.on_program_finished = [this]() { OnProgramFinished(); };
  cb.on_error = [this](const std::string& message) {
    if (stopping_) return;
    if (callbacks_.on_error) callbacks_.on_error(message);
  };
  program_player_.SetCallbacks(std::move(cb));
}

SlideAudioPlayer::~SlideAudioPlayer() { Stop(); }

void SlideAudioPlayer::SetCallbacks(Callbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

bool SlideAudioPlayer::LoadAndPlay(const model::SlideAudioSettings& settings) {
  Stop();

  if (!settings.audio_program_name || settings.audio_program_name->empty()) {
    return false;
  }

  const AudioProgramPlayer::LoadResult result =
      program_player_.Load(*settings.audio_program_name);
  if (!result.ok) {
    std::ostringstream oss;
    oss << "[SlideAudioPlayer] AUDIO_ABSENT program=" << *settings.audio_program_name
        << " reason=" << model::ConfigErrorToString(result.error);
    util::Logger::Warn(oss.str());
    return false;
  }

  settings_ = settings;
  settings_.audio_intro_delay_ms = std::max<int64_t>(0, settings.audio_intro_delay_ms);
  settings_.audio_outro_duration_ms = std::max<int64_t>(0, settings.audio_outro_duration_ms);

  float volume = settings.audio_program_volume;
  if (!(volume >= 0.0f && volume <= 1.0f)) {
    const float clamped = (volume > 1.0f) ? 1.0f : 0.0f;
    std::ostringstream oss;
    oss << "[SlideAudioPlayer] VOLUME_CLAMPED value=" << volume << " used=" << clamped;
    util::Logger::Warn(oss.str());
    volume = clamped;
  }
  settings_.audio_program_volume = volume;

  // Volume goes in before anything can become audible.
  program_player_.SetVolume(volume);

  loaded_ = true;
  ++generation_;
  cycles_started_ = 0;

  std::ostringstream oss;
  oss << "[SlideAudioPlayer] LOAD program=" << *settings_.audio_program_name
      << " intro_ms=" << settings_.audio_intro_delay_ms
      << " outro_ms=" << settings_.audio_outro_duration_ms
      << " loop=" << (settings_.loop_audio_program ? 1 : 0) << " volume=" << volume;
  util::Logger::Info(oss.str());

  StartCycle();
  return true;
}

void SlideAudioPlayer::StartCycle() {
  ++cycles_started_;
  const uint64_t generation = generation_;

  if (settings_.audio_intro_delay_ms > 0) {
    phase_ = Phase::kIntroWait;
    intro_timer_.Start(settings_.audio_intro_delay_ms,
                       [this, generation]() { StartProgram(generation); });
    return;
  }
  StartProgram(generation);
}

void SlideAudioPlayer::StartProgram(uint64_t generation) {
  if (generation != generation_ || stopping_) return;

  phase_ = Phase::kProgramRunning;
  std::ostringstream oss;
  oss << "[SlideAudioPlayer] PROGRAM_START cycle=" << cycles_started_;
  util::Logger::Debug(oss.str());

  if (!program_player_.Play()) {
    OnProgramFinished();
  }
}

void SlideAudioPlayer::OnProgramFinished() {
  if (stopping_ || phase_ != Phase::kProgramRunning) return;

  const uint64_t generation = generation_;
  if (settings_.audio_outro_duration_ms > 0) {
    phase_ = Phase::kOutroWait;
    outro_timer_.Start(settings_.audio_outro_duration_ms,
                       [this, generation]() { OnOutroElapsed(generation); });
    return;
  }
  OnOutroElapsed(generation);
}

void SlideAudioPlayer::OnOutroElapsed(uint64_t generation) {
  if (generation != generation_ || stopping_) return;

  if (settings_.loop_audio_program) {
    std::ostringstream oss;
    oss << "[SlideAudioPlayer] CYCLE_RESTART next_cycle=" << (cycles_started_ + 1);
    util::Logger::Info(oss.str());
    StartCycle();
    return;
  }

  util::Logger::Info("[SlideAudioPlayer] AUDIO_FINISHED");
  Stop();
  if (callbacks_.on_audio_finished) callbacks_.on_audio_finished();
}

void SlideAudioPlayer::Stop() {
  if (stopping_) return;
  if (!loaded_ && phase_ == Phase::kStopped) return;

  stopping_ = true;
  ++generation_;
  intro_timer_.Cancel();
  outro_timer_.Cancel();
  program_player_.Stop();

  // Slide-specific volume must not leak into the next slide.
  program_player_.SetVolume(neutral_volume_);

  std::ostringstream oss;
  oss << "[SlideAudioPlayer] STOPPED phase=" << SlideAudioPhaseToString(phase_);
  util::Logger::Debug(oss.str());

  phase_ = Phase::kStopped;
  settings_ = model::SlideAudioSettings{};
  loaded_ = false;
  stopping_ = false;
}

}  // namespace alphapresenter::audio
