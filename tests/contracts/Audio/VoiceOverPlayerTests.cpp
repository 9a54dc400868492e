// Repository: AlphaPresenter
// Component: Voice-Over Player Contract Tests
// Purpose: Single-clip playback, replacement, volume fallback and error paths.
// Copyright (c) 2025 AlphaPresenter

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "alphapresenter/audio/VoiceOverPlayer.hpp"
#include "fixtures/FakePlaybackEngine.h"
#include "fixtures/InMemoryCatalog.h"

namespace alphapresenter::audio::testing {
namespace {

using media::EngineNotification;
using tests::fixtures::FakePlaybackEngine;
using tests::fixtures::InMemoryCatalog;
using CommandType = FakePlaybackEngine::CommandType;
using State = VoiceOverPlayer::State;

constexpr float kDefaultVolume = 0.9f;
constexpr float kNeutral = 1.0f;

class VoiceOverPlayerTest : public ::testing::Test {
 protected:
  VoiceOverPlayerTest()
      : player_(&engine_, catalog_.AsCatalog(), kDefaultVolume, kNeutral) {
    catalog_.AddTrack("intro_vo", 4000);
    catalog_.AddTrack("outro_vo", 3000);

    VoiceOverPlayer::Callbacks callbacks;
    callbacks.on_finished = [this](const std::string& track) { finished_.push_back(track); };
    callbacks.on_error = [this](const std::string& message) { errors_.push_back(message); };
    player_.SetCallbacks(std::move(callbacks));
  }

  InMemoryCatalog catalog_;
  FakePlaybackEngine engine_;
  VoiceOverPlayer player_;

  std::vector<std::string> finished_;
  std::vector<std::string> errors_;
};

TEST_F(VoiceOverPlayerTest, PlaysAtDefaultVolumeAndReportsFinished) {
  ASSERT_TRUE(player_.Play("intro_vo"));
  EXPECT_EQ(player_.state(), State::kPlaying);
  EXPECT_TRUE(player_.IsPlaying());
  EXPECT_EQ(engine_.uri(), InMemoryCatalog::UriFor("intro_vo.mp3"));
  EXPECT_FLOAT_EQ(engine_.volume(), kDefaultVolume);
  EXPECT_TRUE(engine_.Seeks().empty());

  engine_.EmitEndOfMedia();
  EXPECT_EQ(finished_, (std::vector<std::string>{"intro_vo"}));
  EXPECT_EQ(player_.state(), State::kIdle);
  EXPECT_FLOAT_EQ(engine_.volume(), kNeutral);
  EXPECT_TRUE(errors_.empty());
}

TEST_F(VoiceOverPlayerTest, ExplicitVolumeAndStartOffset) {
  ASSERT_TRUE(player_.Play("intro_vo", 0.4f, 1500));
  EXPECT_FLOAT_EQ(engine_.volume(), 0.4f);
  EXPECT_EQ(engine_.Seeks(), (std::vector<int64_t>{1500}));
  EXPECT_EQ(engine_.CountOf(CommandType::kPlay), 1u);
}

TEST_F(VoiceOverPlayerTest, InvalidVolumeFallsBackToDefault) {
  ASSERT_TRUE(player_.Play("intro_vo", 2.0f));
  EXPECT_FLOAT_EQ(engine_.volume(), kDefaultVolume);
}

TEST_F(VoiceOverPlayerTest, MissingTrackReportsError) {
  EXPECT_FALSE(player_.Play("ghost"));
  ASSERT_EQ(errors_.size(), 1u);
  EXPECT_NE(errors_[0].find("ghost"), std::string::npos);
  EXPECT_TRUE(engine_.LoadedSources().empty());
  EXPECT_EQ(player_.state(), State::kIdle);
}

TEST_F(VoiceOverPlayerTest, MissingMediaReportsError) {
  catalog_.AddTrackMetadataOnly("orphan", "orphan.wav", 1000);
  EXPECT_FALSE(player_.Play("orphan"));
  ASSERT_EQ(errors_.size(), 1u);
  EXPECT_NE(errors_[0].find("orphan.wav"), std::string::npos);
  EXPECT_TRUE(engine_.LoadedSources().empty());
}

TEST_F(VoiceOverPlayerTest, NewClipReplacesCurrentOne) {
  ASSERT_TRUE(player_.Play("intro_vo"));
  const uint64_t first_token = engine_.token();

  ASSERT_TRUE(player_.Play("outro_vo"));
  EXPECT_EQ(player_.track_name(), "outro_vo");
  EXPECT_EQ(engine_.CountOf(CommandType::kStop), 1u);

  // Late end-of-media from the replaced clip.
  engine_.EmitWithToken(EngineNotification::Kind::kEndOfMedia, first_token);
  EXPECT_TRUE(finished_.empty());
  EXPECT_TRUE(player_.IsPlaying());

  engine_.EmitEndOfMedia();
  EXPECT_EQ(finished_, (std::vector<std::string>{"outro_vo"}));
}

TEST_F(VoiceOverPlayerTest, StopIsIdempotentAndNeverFinishes) {
  ASSERT_TRUE(player_.Play("intro_vo"));
  player_.Stop();
  player_.Stop();

  EXPECT_EQ(engine_.CountOf(CommandType::kStop), 1u);
  EXPECT_EQ(player_.state(), State::kIdle);
  EXPECT_FLOAT_EQ(engine_.volume(), kNeutral);

  engine_.EmitEndOfMedia();
  EXPECT_TRUE(finished_.empty());
}

TEST_F(VoiceOverPlayerTest, UnplayableMediaReportsErrorAndStops) {
  engine_.MarkBroken(InMemoryCatalog::UriFor("intro_vo.mp3"));
  player_.Play("intro_vo");

  ASSERT_EQ(errors_.size(), 1u);
  EXPECT_NE(errors_[0].find("intro_vo"), std::string::npos);
  EXPECT_EQ(player_.state(), State::kIdle);
  EXPECT_TRUE(finished_.empty());
}

TEST_F(VoiceOverPlayerTest, PlaybackErrorReportsAndStops) {
  ASSERT_TRUE(player_.Play("intro_vo"));
  engine_.EmitError("device lost");

  ASSERT_EQ(errors_.size(), 1u);
  EXPECT_NE(errors_[0].find("device lost"), std::string::npos);
  EXPECT_FALSE(player_.IsPlaying());
  EXPECT_FLOAT_EQ(engine_.volume(), kNeutral);
}

}  // namespace
}  // namespace alphapresenter::audio::testing
