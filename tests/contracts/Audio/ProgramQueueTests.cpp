// Repository: AlphaPresenter
// Component: Program Queue Contract Tests
// Purpose: Track filtering, end clamping, play-order sorting and planned
//          program length.
// Copyright (c) 2025 AlphaPresenter

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "alphapresenter/audio/ProgramQueue.hpp"
#include "fixtures/InMemoryCatalog.h"

namespace alphapresenter::audio::testing {
namespace {

using model::AudioProgram;
using model::ConfigError;
using tests::fixtures::Entry;
using tests::fixtures::InMemoryCatalog;

std::vector<std::string> Names(const ProgramQueue& queue) {
  std::vector<std::string> names;
  for (const auto& t : queue.tracks) names.push_back(t.track_name);
  return names;
}

AudioProgram Program(const std::string& name, std::vector<model::ProgramTrackEntry> entries) {
  AudioProgram program;
  program.program_name = name;
  program.tracks = std::move(entries);
  return program;
}

TEST(ProgramQueueBuild, SortsByPlayOrderKeepingAuthoredOrderForTies) {
  InMemoryCatalog catalog;
  catalog.AddTrack("a", 1000);
  catalog.AddTrack("b", 1000);
  catalog.AddTrack("c", 1000);
  catalog.AddTrack("d", 1000);

  AudioProgram program =
      Program("p", {Entry("a", 3), Entry("b", 1), Entry("c", 2), Entry("d", 1)});
  ProgramQueue queue = BuildProgramQueue(program, catalog, catalog);

  EXPECT_EQ(Names(queue), (std::vector<std::string>{"b", "d", "c", "a"}));
  EXPECT_TRUE(queue.rejected.empty());
  EXPECT_EQ(queue.tracks[0].uri, InMemoryCatalog::UriFor("b.mp3"));
}

TEST(ProgramQueueBuild, StartAtOrBeyondDetectedDurationIsExcluded) {
  InMemoryCatalog catalog;
  catalog.AddTrack("at_end", 1000);
  catalog.AddTrack("past_end", 1000);
  catalog.AddTrack("ok", 1000);

  AudioProgram program = Program(
      "p", {Entry("at_end", 1, 1000), Entry("past_end", 2, 4000), Entry("ok", 3, 999)});
  ProgramQueue queue = BuildProgramQueue(program, catalog, catalog);

  ASSERT_EQ(Names(queue), (std::vector<std::string>{"ok"}));
  EXPECT_EQ(queue.tracks[0].effective_duration_ms, std::optional<int64_t>(1));

  ASSERT_EQ(queue.rejected.size(), 2u);
  EXPECT_EQ(queue.rejected[0].track_name, "at_end");
  EXPECT_EQ(queue.rejected[0].reason, ConfigError::kNonPositiveDuration);
  EXPECT_EQ(queue.rejected[1].reason, ConfigError::kNonPositiveDuration);
}

TEST(ProgramQueueBuild, UserEndNotAfterStartIsExcluded) {
  InMemoryCatalog catalog;
  catalog.AddTrack("a", 10000);

  ProgramQueue queue =
      BuildProgramQueue(Program("p", {Entry("a", 1, 3000, 3000)}), catalog, catalog);
  EXPECT_TRUE(queue.tracks.empty());
  ASSERT_EQ(queue.rejected.size(), 1u);
  EXPECT_EQ(queue.rejected[0].reason, ConfigError::kNonPositiveDuration);
}

TEST(ProgramQueueBuild, UserEndBeyondDetectedIsClamped) {
  InMemoryCatalog catalog;
  catalog.AddTrack("a", 1000);

  ProgramQueue queue =
      BuildProgramQueue(Program("p", {Entry("a", 1, 200, 5000)}), catalog, catalog);
  ASSERT_EQ(queue.tracks.size(), 1u);
  EXPECT_EQ(queue.tracks[0].start_ms, 200);
  EXPECT_EQ(queue.tracks[0].end_ms, std::optional<int64_t>(1000));
  EXPECT_EQ(queue.tracks[0].effective_duration_ms, std::optional<int64_t>(800));
}

TEST(ProgramQueueBuild, DetectedDurationBecomesDeadline) {
  InMemoryCatalog catalog;
  catalog.AddTrack("a", 4000);

  ProgramQueue queue =
      BuildProgramQueue(Program("p", {Entry("a", 1, 1500)}), catalog, catalog);
  ASSERT_EQ(queue.tracks.size(), 1u);
  EXPECT_EQ(queue.tracks[0].end_ms, std::optional<int64_t>(4000));
  EXPECT_EQ(queue.tracks[0].effective_duration_ms, std::optional<int64_t>(2500));
}

TEST(ProgramQueueBuild, UnknownDurationIsKeptWithoutDeadline) {
  InMemoryCatalog catalog;
  catalog.AddTrack("stream", std::nullopt);
  catalog.AddTrack("trimmed", std::nullopt);

  ProgramQueue queue = BuildProgramQueue(
      Program("p", {Entry("stream", 1, 500), Entry("trimmed", 2, 1000, 3000)}), catalog,
      catalog);
  ASSERT_EQ(queue.tracks.size(), 2u);

  EXPECT_FALSE(queue.tracks[0].end_ms.has_value());
  EXPECT_FALSE(queue.tracks[0].effective_duration_ms.has_value());
  EXPECT_EQ(queue.tracks[0].start_ms, 500);

  EXPECT_EQ(queue.tracks[1].end_ms, std::optional<int64_t>(3000));
  EXPECT_EQ(queue.tracks[1].effective_duration_ms, std::optional<int64_t>(2000));
}

TEST(ProgramQueueBuild, MissingMetadataAndMediaAreSkipped) {
  InMemoryCatalog catalog;
  catalog.AddTrack("ok", 1000);
  catalog.AddTrackMetadataOnly("no_file", "no_file.mp3", 1000);

  ProgramQueue queue = BuildProgramQueue(
      Program("p", {Entry("ghost", 1), Entry("no_file", 2), Entry("ok", 3)}), catalog,
      catalog);

  EXPECT_EQ(Names(queue), (std::vector<std::string>{"ok"}));
  ASSERT_EQ(queue.rejected.size(), 2u);
  EXPECT_EQ(queue.rejected[0].reason, ConfigError::kTrackMetadataMissing);
  EXPECT_EQ(queue.rejected[1].reason, ConfigError::kMediaMissing);
}

TEST(ProgramQueueBuild, NegativeStartIsTreatedAsZero) {
  InMemoryCatalog catalog;
  catalog.AddTrack("a", 1000);

  ProgramQueue queue =
      BuildProgramQueue(Program("p", {Entry("a", 1, -250)}), catalog, catalog);
  ASSERT_EQ(queue.tracks.size(), 1u);
  EXPECT_EQ(queue.tracks[0].start_ms, 0);
  EXPECT_EQ(queue.tracks[0].effective_duration_ms, std::optional<int64_t>(1000));
}

// =============================================================================
// Planned length
// =============================================================================

TEST(ProgramQueueDuration, SumsPassesIncludingLoopRepeats) {
  InMemoryCatalog catalog;
  catalog.AddTrack("a", 1000);
  catalog.AddTrack("b", 2000);

  AudioProgram program = Program("p", {Entry("a", 1), Entry("b", 2, 500)});
  ProgramQueue queue = BuildProgramQueue(program, catalog, catalog);
  EXPECT_EQ(TotalProgramDurationMs(queue.tracks, program), std::optional<int64_t>(2500));

  program.loop_count = 2;
  EXPECT_EQ(TotalProgramDurationMs(queue.tracks, program), std::optional<int64_t>(7500));
}

TEST(ProgramQueueDuration, UnknownWhenIndefiniteOrAnyTrackUnknown) {
  InMemoryCatalog catalog;
  catalog.AddTrack("a", 1000);
  catalog.AddTrack("stream", std::nullopt);

  AudioProgram looping = Program("p", {Entry("a", 1)});
  looping.loop_indefinitely = true;
  ProgramQueue queue = BuildProgramQueue(looping, catalog, catalog);
  EXPECT_FALSE(TotalProgramDurationMs(queue.tracks, looping).has_value());

  AudioProgram mixed = Program("p", {Entry("a", 1), Entry("stream", 2)});
  queue = BuildProgramQueue(mixed, catalog, catalog);
  EXPECT_FALSE(TotalProgramDurationMs(queue.tracks, mixed).has_value());
}

}  // namespace
}  // namespace alphapresenter::audio::testing
