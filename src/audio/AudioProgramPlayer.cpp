// Repository: AlphaPresenter
// Component: Audio Program Player
// Purpose: Sequential multi-track playback with trims, deadlines and looping.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/audio/AudioProgramPlayer.hpp"

#include <algorithm>
#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::audio {

using media::EngineNotification;
using media::PlaybackState;
using model::ConfigError;

const char* AudioProgramPlayerStateToString(AudioProgramPlayer::State state) {
  switch (state) {
    case AudioProgramPlayer::State::kIdle: return "idle";
    case AudioProgramPlayer::State::kLoading: return "loading";
    case AudioProgramPlayer::State::kPlaying: return "playing";
    case AudioProgramPlayer::State::kPaused: return "paused";
    case AudioProgramPlayer::State::kStopping: return "stopping";
  }
  return "unknown";
}

AudioProgramPlayer::AudioProgramPlayer(runtime::EventLoop* loop,
                                       media::IPlaybackEngine* engine,
                                       model::Catalog catalog)
    : engine_(engine),
      catalog_(catalog),
      deadline_timer_(loop),
      advance_timer_(loop) {
  engine_->SetNotificationCallback(
      [this](const EngineNotification& n) { OnEngineNotification(n); });
}

AudioProgramPlayer::~AudioProgramPlayer() {
  Stop();
  engine_->SetNotificationCallback(nullptr);
}

void AudioProgramPlayer::SetCallbacks(Callbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

// =============================================================================
// Load
// =============================================================================

AudioProgramPlayer::LoadResult AudioProgramPlayer::Load(const std::string& program_name) {
  std::optional<model::AudioProgram> program;
  if (catalog_.programs) program = catalog_.programs->LoadProgram(program_name);

  if (!program) {
    Stop();
    program_ = model::AudioProgram{};
    queue_.clear();
    std::ostringstream oss;
    oss << "[AudioProgramPlayer] LOAD_FAILED program=" << program_name
        << " reason=" << model::ConfigErrorToString(ConfigError::kProgramMissing);
    util::Logger::Warn(oss.str());
    return LoadResult::Failure(ConfigError::kProgramMissing, program_name);
  }
  return Load(*program);
}

AudioProgramPlayer::LoadResult AudioProgramPlayer::Load(const model::AudioProgram& program) {
  Stop();

  ProgramQueue built = BuildProgramQueue(program, *catalog_.tracks, *catalog_.locator);
  if (built.tracks.empty()) {
    program_ = model::AudioProgram{};
    queue_.clear();
    std::ostringstream oss;
    oss << "[AudioProgramPlayer] LOAD_FAILED program=" << program.program_name
        << " reason=" << model::ConfigErrorToString(ConfigError::kNoPlayableTracks)
        << " entries=" << program.tracks.size()
        << " rejected=" << built.rejected.size();
    util::Logger::Warn(oss.str());
    return LoadResult::Failure(ConfigError::kNoPlayableTracks, program.program_name);
  }

  program_ = program;
  queue_ = std::move(built.tracks);

  std::ostringstream oss;
  oss << "[AudioProgramPlayer] LOADED program=" << program_.program_name
      << " tracks=" << queue_.size() << " rejected=" << built.rejected.size()
      << " loop_indefinitely=" << (program_.loop_indefinitely ? 1 : 0)
      << " loop_count=" << program_.loop_count;
  util::Logger::Info(oss.str());

  return LoadResult::Success(queue_.size());
}

std::optional<int64_t> AudioProgramPlayer::TotalDurationMs() const {
  if (queue_.empty()) return std::nullopt;
  return TotalProgramDurationMs(queue_, program_);
}

// =============================================================================
// Transport
// =============================================================================

bool AudioProgramPlayer::Play() {
  if (queue_.empty()) {
    util::Logger::Debug("[AudioProgramPlayer] PLAY_IGNORED reason=no_program");
    return false;
  }
  if (state_ != State::kIdle) Stop();

  loops_remaining_ = std::max(0, program_.loop_count);
  completed_passes_ = 0;
  StartTrack(0);
  return true;
}

bool AudioProgramPlayer::Pause() {
  if (state_ != State::kPlaying) return false;
  deadline_timer_.Cancel();
  state_ = State::kPaused;
  engine_->Pause();
  util::Logger::Debug("[AudioProgramPlayer] PAUSED");
  return true;
}

bool AudioProgramPlayer::Resume() {
  if (state_ != State::kPaused) return false;
  // The deadline is re-armed from the engine position once it reports playing.
  engine_->Play();
  util::Logger::Debug("[AudioProgramPlayer] RESUME_REQUESTED");
  return true;
}

void AudioProgramPlayer::Stop() {
  if (state_ == State::kStopping || state_ == State::kIdle) return;

  state_ = State::kStopping;
  ++generation_;
  deadline_timer_.Cancel();
  advance_timer_.Cancel();

  engine_->Stop();
  engine_->SetSource("", generation_);

  std::ostringstream oss;
  oss << "[AudioProgramPlayer] STOPPED program=" << program_.program_name
      << " index=" << current_index_;
  util::Logger::Info(oss.str());

  current_index_ = -1;
  state_ = State::kIdle;
}

bool AudioProgramPlayer::SetVolume(float volume) {
  if (!(volume >= 0.0f && volume <= 1.0f)) {
    std::ostringstream oss;
    oss << "[AudioProgramPlayer] VOLUME_REJECTED value=" << volume << " kept=" << volume_;
    util::Logger::Warn(oss.str());
    return false;
  }
  volume_ = volume;
  engine_->SetVolume(volume);
  return true;
}

// =============================================================================
// Track lifecycle
// =============================================================================

void AudioProgramPlayer::StartTrack(size_t index) {
  deadline_timer_.Cancel();
  advance_timer_.Cancel();
  ++generation_;
  const uint64_t generation = generation_;

  current_index_ = static_cast<int>(index);
  state_ = State::kLoading;
  const QueuedTrack& track = queue_[index];

  std::ostringstream oss;
  oss << "[AudioProgramPlayer] TRACK_START index=" << index << " name=" << track.track_name
      << " start_ms=" << track.start_ms << " end_ms=";
  if (track.end_ms) {
    oss << *track.end_ms;
  } else {
    oss << "eom";
  }
  oss << " pass=" << (completed_passes_ + 1);
  util::Logger::Info(oss.str());

  engine_->SetSource(track.uri, generation);

  // A synchronous engine may already have moved us on.
  if (generation != generation_) return;
  if (callbacks_.on_track_changed) callbacks_.on_track_changed(index, track.track_name);
}

void AudioProgramPlayer::OnEngineNotification(const EngineNotification& notification) {
  if (state_ == State::kStopping || state_ == State::kIdle) {
    std::ostringstream oss;
    oss << "[AudioProgramPlayer] NOTIFICATION_DROPPED kind="
        << media::NotificationKindToString(notification.kind)
        << " state=" << AudioProgramPlayerStateToString(state_);
    util::Logger::Debug(oss.str());
    return;
  }
  if (notification.load_token != generation_) {
    std::ostringstream oss;
    oss << "[AudioProgramPlayer] STALE_NOTIFICATION kind="
        << media::NotificationKindToString(notification.kind)
        << " token=" << notification.load_token << " current=" << generation_;
    util::Logger::Debug(oss.str());
    return;
  }

  using Kind = EngineNotification::Kind;
  switch (notification.kind) {
    case Kind::kSourceLoaded:
      OnSourceLoaded();
      break;
    case Kind::kPlaybackStateChanged:
      OnPlaybackStateChanged(notification.state);
      break;
    case Kind::kEndOfMedia:
      EndCurrentTrack("end_of_media");
      break;
    case Kind::kInvalidMedia:
    case Kind::kError: {
      const QueuedTrack& track = queue_[static_cast<size_t>(current_index_)];
      std::ostringstream oss;
      oss << "[AudioProgramPlayer] TRACK_ERROR index=" << current_index_
          << " name=" << track.track_name
          << " kind=" << media::NotificationKindToString(notification.kind)
          << " message=" << notification.message;
      util::Logger::Warn(oss.str());
      const std::string message = track.track_name + ": " + notification.message;
      // The failed source is stopped before the next one is loaded.
      ++generation_;
      engine_->Stop();
      EndCurrentTrack("error");
      if (callbacks_.on_error) callbacks_.on_error(message);
      break;
    }
    case Kind::kNoMedia:
    case Kind::kDurationKnown:
    case Kind::kPositionChanged:
      break;
  }
}

void AudioProgramPlayer::OnSourceLoaded() {
  if (state_ != State::kLoading) return;
  const QueuedTrack& track = queue_[static_cast<size_t>(current_index_)];

  // Seeking is only legal once the engine has the source loaded.
  if (track.start_ms > 0) {
    if (engine_->IsSeekable()) {
      engine_->Seek(track.start_ms);
    } else {
      std::ostringstream oss;
      oss << "[AudioProgramPlayer] SEEK_UNSUPPORTED name=" << track.track_name
          << " start_ms=" << track.start_ms;
      util::Logger::Warn(oss.str());
    }
  }
  engine_->Play();
}

void AudioProgramPlayer::OnPlaybackStateChanged(PlaybackState engine_state) {
  switch (engine_state) {
    case PlaybackState::kPlaying:
      if (state_ == State::kLoading || state_ == State::kPaused) {
        state_ = State::kPlaying;
        ArmTrackDeadline();
      }
      break;
    case PlaybackState::kPaused:
      if (state_ == State::kPlaying) {
        deadline_timer_.Cancel();
        state_ = State::kPaused;
      }
      break;
    case PlaybackState::kStopped:
      // Track ends arrive as end-of-media; a bare stop carries no decision.
      break;
  }
}

void AudioProgramPlayer::ArmTrackDeadline() {
  const QueuedTrack& track = queue_[static_cast<size_t>(current_index_)];
  if (!track.end_ms) return;

  // Position may still be 0 if the seek has not landed yet.
  const int64_t position_ms = std::max(engine_->PositionMs(), track.start_ms);
  const int64_t remaining_ms = *track.end_ms - position_ms;

  if (remaining_ms <= 0) {
    ++generation_;
    engine_->Stop();
    EndCurrentTrack("deadline_passed");
    return;
  }

  const uint64_t generation = generation_;
  deadline_timer_.Start(remaining_ms,
                        [this, generation]() { OnTrackDeadline(generation); });

  std::ostringstream oss;
  oss << "[AudioProgramPlayer] DEADLINE_ARMED index=" << current_index_
      << " remaining_ms=" << remaining_ms;
  util::Logger::Debug(oss.str());
}

void AudioProgramPlayer::OnTrackDeadline(uint64_t generation) {
  if (generation != generation_ || state_ != State::kPlaying) return;

  // Race with end-of-media is first-wins: whichever path runs first bumps the
  // generation and the other is dropped as stale.
  ++generation_;
  engine_->Stop();
  EndCurrentTrack("deadline");
}

void AudioProgramPlayer::EndCurrentTrack(const char* reason) {
  deadline_timer_.Cancel();
  ++generation_;
  state_ = State::kLoading;

  std::ostringstream oss;
  oss << "[AudioProgramPlayer] TRACK_END index=" << current_index_ << " reason=" << reason;
  util::Logger::Info(oss.str());

  const uint64_t generation = generation_;
  advance_timer_.Start(0, [this, generation]() {
    if (generation != generation_) return;
    AdvanceToNextTrack();
  });
}

void AudioProgramPlayer::AdvanceToNextTrack() {
  const size_t next = static_cast<size_t>(current_index_ + 1);
  if (next < queue_.size()) {
    StartTrack(next);
    return;
  }

  ++completed_passes_;

  if (program_.loop_indefinitely) {
    std::ostringstream oss;
    oss << "[AudioProgramPlayer] PROGRAM_LOOP mode=indefinite passes=" << completed_passes_;
    util::Logger::Info(oss.str());
    StartTrack(0);
    return;
  }

  if (loops_remaining_ > 0) {
    --loops_remaining_;
    std::ostringstream oss;
    oss << "[AudioProgramPlayer] PROGRAM_LOOP mode=count remaining=" << loops_remaining_
        << " passes=" << completed_passes_;
    util::Logger::Info(oss.str());
    StartTrack(0);
    return;
  }

  FinishProgram();
}

void AudioProgramPlayer::FinishProgram() {
  std::ostringstream oss;
  oss << "[AudioProgramPlayer] PROGRAM_FINISHED program=" << program_.program_name
      << " passes=" << completed_passes_;
  util::Logger::Info(oss.str());

  Stop();
  if (callbacks_.on_program_finished) callbacks_.on_program_finished();
}

}  // namespace alphapresenter::audio
