// Repository: AlphaPresenter
// Component: Playlist Validator Contract Tests
// Purpose: Timer, loop, text and audio findings for playlist snapshots.
// Copyright (c) 2025 AlphaPresenter

#include <gtest/gtest.h>

#include <vector>

#include "alphapresenter/presenter/PlaylistValidator.hpp"
#include "fixtures/InMemoryCatalog.h"

namespace alphapresenter::presenter::testing {
namespace {

using model::Paragraph;
using model::Slide;
using tests::fixtures::Entry;
using tests::fixtures::InMemoryCatalog;

Slide MakeSlide(int duration, int loop_to) {
  Slide slide;
  slide.layers = {"bg.png"};
  slide.duration = duration;
  slide.loop_to_slide = loop_to;
  return slide;
}

model::TextOverlaySelection Overlay(const std::string& paragraph, bool timing, bool auto_advance) {
  model::TextOverlaySelection overlay;
  overlay.paragraph_name = paragraph;
  overlay.sentence_timing_enabled = timing;
  overlay.auto_advance_slide = auto_advance;
  return overlay;
}

class PlaylistValidatorTest : public ::testing::Test {
 protected:
  PlaylistValidatorTest() : validator_(catalog_.AsCatalog()) {
    catalog_.AddParagraph(Paragraph{"three", {{"a", 1.0}, {"b", 1.0}, {"c", 0.0}}});
    catalog_.AddParagraph(Paragraph{"empty", {}});
    catalog_.AddTrack("song", 1000);

    model::AudioProgram good;
    good.program_name = "good";
    good.tracks = {Entry("song", 1)};
    catalog_.AddProgram(good);

    model::AudioProgram dead;
    dead.program_name = "dead";
    dead.tracks = {Entry("song", 1, 5000), Entry("ghost", 2)};
    catalog_.AddProgram(dead);
  }

  SlideIssues ValidateSingle(const std::vector<Slide>& slides, size_t index) {
    for (const auto& issues : validator_.Validate(slides)) {
      if (issues.index == index) return issues;
    }
    SlideIssues none;
    none.index = index;
    return none;
  }

  InMemoryCatalog catalog_;
  PlaylistValidator validator_;
};

TEST_F(PlaylistValidatorTest, CleanPlaylistHasNoIssues) {
  Slide looping = MakeSlide(5, 1);
  Slide text = MakeSlide(2, 0);
  text.text_overlay = Overlay("three", true, true);
  text.audio.audio_program_name = "good";
  Slide still = MakeSlide(0, 0);

  EXPECT_TRUE(validator_.Validate({MakeSlide(3, 3), text, still}).empty());

  // A timed image-only slide looping to itself is a restart cycle.
  EXPECT_TRUE(validator_.Validate({looping, still}).empty());
}

TEST_F(PlaylistValidatorTest, TimerWithoutLoopTargetHasNoEffect) {
  SlideIssues issues = ValidateSingle({MakeSlide(4, 0), MakeSlide(0, 0)}, 0);
  EXPECT_TRUE(issues.Has(IssueKind::kTimer));
  EXPECT_FALSE(issues.Has(IssueKind::kLoop));
}

TEST_F(PlaylistValidatorTest, LoopWithoutTriggerIsInactive) {
  SlideIssues issues = ValidateSingle({MakeSlide(0, 2), MakeSlide(0, 0)}, 0);
  EXPECT_TRUE(issues.Has(IssueKind::kLoop));

  Slide manual_text = MakeSlide(0, 2);
  manual_text.text_overlay = Overlay("three", false, false);
  EXPECT_TRUE(ValidateSingle({manual_text, MakeSlide(0, 0)}, 0).Has(IssueKind::kLoop));

  Slide auto_text = MakeSlide(0, 2);
  auto_text.text_overlay = Overlay("three", true, true);
  EXPECT_FALSE(ValidateSingle({auto_text, MakeSlide(0, 0)}, 0).Has(IssueKind::kLoop));
}

TEST_F(PlaylistValidatorTest, SelfLoopWithTextIsFlagged) {
  Slide slide = MakeSlide(2, 1);
  slide.text_overlay = Overlay("three", true, true);
  EXPECT_TRUE(ValidateSingle({slide, MakeSlide(0, 0)}, 0).Has(IssueKind::kLoop));
}

TEST_F(PlaylistValidatorTest, LoopTargetOutOfRange) {
  SlideIssues issues = ValidateSingle({MakeSlide(2, 7), MakeSlide(0, 0)}, 0);
  ASSERT_TRUE(issues.Has(IssueKind::kLoop));
  ASSERT_FALSE(issues.descriptions.empty());
  EXPECT_NE(issues.descriptions.back().find("out of range"), std::string::npos);
}

TEST_F(PlaylistValidatorTest, TextOverlayProblems) {
  Slide missing = MakeSlide(0, 0);
  missing.text_overlay = Overlay("nope", false, false);

  Slide empty = MakeSlide(0, 0);
  empty.text_overlay = Overlay("empty", false, false);

  Slide bad_range = MakeSlide(0, 0);
  bad_range.text_overlay = Overlay("three", false, false);
  bad_range.text_overlay->start_sentence = 3;
  bad_range.text_overlay->end_sentence = 2;

  Slide unnamed = MakeSlide(0, 0);
  unnamed.text_overlay = Overlay("", false, false);

  const std::vector<SlideIssues> found = validator_.Validate({missing, empty, bad_range, unnamed});
  ASSERT_EQ(found.size(), 4u);
  for (const auto& issues : found) {
    EXPECT_TRUE(issues.Has(IssueKind::kText)) << "slide " << issues.index;
    EXPECT_EQ(issues.kinds.size(), 1u);
  }
}

TEST_F(PlaylistValidatorTest, AudioProblems) {
  Slide missing = MakeSlide(0, 0);
  missing.audio.audio_program_name = "nope";

  Slide unplayable = MakeSlide(0, 0);
  unplayable.audio.audio_program_name = "dead";

  Slide bad_numbers = MakeSlide(0, 0);
  bad_numbers.audio.audio_program_name = "good";
  bad_numbers.audio.audio_intro_delay_ms = -5;
  bad_numbers.audio.audio_program_volume = 1.5f;

  const std::vector<SlideIssues> found = validator_.Validate({missing, unplayable, bad_numbers});
  ASSERT_EQ(found.size(), 3u);
  EXPECT_TRUE(found[0].Has(IssueKind::kAudio));
  EXPECT_TRUE(found[1].Has(IssueKind::kAudio));
  EXPECT_TRUE(found[2].Has(IssueKind::kAudio));
  EXPECT_EQ(found[2].descriptions.size(), 2u);
}

TEST_F(PlaylistValidatorTest, ValidationDoesNotModifySlides) {
  Slide slide = MakeSlide(3, 9);
  slide.audio.audio_program_name = "nope";
  const std::vector<Slide> slides = {slide};
  validator_.Validate(slides);
  EXPECT_EQ(slides[0].duration, 3);
  EXPECT_EQ(slides[0].loop_to_slide, 9);
  EXPECT_EQ(IssueKindToString(IssueKind::kAudio), std::string("audio"));
}

}  // namespace
}  // namespace alphapresenter::presenter::testing
