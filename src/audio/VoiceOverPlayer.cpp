// Repository: AlphaPresenter
// Component: Voice-Over Player
// Purpose: Single-track narration playback.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/audio/VoiceOverPlayer.hpp"

#include <algorithm>
#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::audio {

using media::EngineNotification;

VoiceOverPlayer::VoiceOverPlayer(media::IPlaybackEngine* engine,
                                 model::Catalog catalog,
                                 float default_volume,
                                 float neutral_volume)
    : engine_(engine),
      catalog_(catalog),
      default_volume_(default_volume),
      neutral_volume_(neutral_volume) {
  engine_->SetNotificationCallback(
      [this](const EngineNotification& n) { OnEngineNotification(n); });
}

VoiceOverPlayer::~VoiceOverPlayer() {
  Stop();
  engine_->SetNotificationCallback(nullptr);
}

void VoiceOverPlayer::SetCallbacks(Callbacks callbacks) {
  callbacks_ = std::move(callbacks);
}

bool VoiceOverPlayer::Play(const std::string& track_name,
                           std::optional<float> volume,
                           int64_t start_offset_ms) {
  Stop();

  std::optional<model::TrackMetadata> metadata;
  if (catalog_.tracks) metadata = catalog_.tracks->LoadTrackMetadata(track_name);
  if (!metadata) {
    std::ostringstream oss;
    oss << "[VoiceOverPlayer] PLAY_FAILED track=" << track_name
        << " reason=" << model::ConfigErrorToString(model::ConfigError::kTrackMetadataMissing);
    util::Logger::Warn(oss.str());
    if (callbacks_.on_error) callbacks_.on_error("voice-over track not found: " + track_name);
    return false;
  }
  if (!catalog_.locator->Exists(metadata->file_path)) {
    std::ostringstream oss;
    oss << "[VoiceOverPlayer] PLAY_FAILED track=" << track_name
        << " reason=" << model::ConfigErrorToString(model::ConfigError::kMediaMissing)
        << " file=" << metadata->file_path;
    util::Logger::Warn(oss.str());
    if (callbacks_.on_error) callbacks_.on_error("voice-over media missing: " + metadata->file_path);
    return false;
  }

  float applied = volume.value_or(default_volume_);
  if (!(applied >= 0.0f && applied <= 1.0f)) {
    std::ostringstream oss;
    oss << "[VoiceOverPlayer] VOLUME_REJECTED value=" << applied << " used=" << default_volume_;
    util::Logger::Warn(oss.str());
    applied = default_volume_;
  }

  ++generation_;
  state_ = State::kLoading;
  track_name_ = track_name;
  start_offset_ms_ = std::max<int64_t>(0, start_offset_ms);

  std::ostringstream oss;
  oss << "[VoiceOverPlayer] PLAY track=" << track_name << " volume=" << applied
      << " start_ms=" << start_offset_ms_;
  util::Logger::Info(oss.str());

  engine_->SetVolume(applied);
  engine_->SetSource(catalog_.locator->Resolve(metadata->file_path), generation_);
  return true;
}

void VoiceOverPlayer::Stop() {
  if (state_ == State::kIdle || state_ == State::kStopping) return;

  state_ = State::kStopping;
  ++generation_;
  engine_->Stop();
  engine_->SetSource("", generation_);
  engine_->SetVolume(neutral_volume_);

  std::ostringstream oss;
  oss << "[VoiceOverPlayer] STOPPED track=" << track_name_;
  util::Logger::Debug(oss.str());

  state_ = State::kIdle;
}

void VoiceOverPlayer::Fail(const std::string& message) {
  const std::string track = track_name_;
  std::ostringstream oss;
  oss << "[VoiceOverPlayer] ERROR track=" << track << " message=" << message;
  util::Logger::Warn(oss.str());
  Stop();
  if (callbacks_.on_error) callbacks_.on_error(track + ": " + message);
}

void VoiceOverPlayer::OnEngineNotification(const EngineNotification& notification) {
  if (state_ == State::kIdle || state_ == State::kStopping) return;
  if (notification.load_token != generation_) return;

  using Kind = EngineNotification::Kind;
  switch (notification.kind) {
    case Kind::kSourceLoaded:
      if (state_ != State::kLoading) break;
      if (start_offset_ms_ > 0 && engine_->IsSeekable()) {
        engine_->Seek(start_offset_ms_);
      }
      engine_->Play();
      break;
    case Kind::kPlaybackStateChanged:
      if (notification.state == media::PlaybackState::kPlaying) state_ = State::kPlaying;
      break;
    case Kind::kEndOfMedia: {
      const std::string track = track_name_;
      std::ostringstream oss;
      oss << "[VoiceOverPlayer] FINISHED track=" << track;
      util::Logger::Info(oss.str());
      Stop();
      if (callbacks_.on_finished) callbacks_.on_finished(track);
      break;
    }
    case Kind::kInvalidMedia:
      Fail(notification.message.empty() ? "invalid media" : notification.message);
      break;
    case Kind::kError:
      Fail(notification.message);
      break;
    case Kind::kNoMedia:
    case Kind::kDurationKnown:
    case Kind::kPositionChanged:
      break;
  }
}

}  // namespace alphapresenter::audio
