// Repository: AlphaPresenter
// Component: Presentation Types
// Purpose: Plain data carried between the metadata providers and the
//          orchestration core: paragraphs, audio programs, slides.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_MODEL_PRESENTATION_TYPES_HPP_
#define ALPHAPRESENTER_MODEL_PRESENTATION_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace alphapresenter::model {

// =============================================================================
// Text
// =============================================================================

struct Sentence {
  std::string text;

  // 0: no auto-advance timer for this sentence.
  double delay_seconds = 0.0;
};

struct Paragraph {
  std::string name;
  std::vector<Sentence> sentences;
};

// Sentence numbers are 1-based as authored in the playlist.
struct TextOverlaySelection {
  std::string paragraph_name;
  int start_sentence = 1;

  // std::nullopt means "all": the range ends at the last sentence.
  std::optional<int> end_sentence;

  bool sentence_timing_enabled = false;
  bool auto_advance_slide = false;
};

// =============================================================================
// Audio
// =============================================================================

struct TrackMetadata {
  std::string track_name;
  std::string file_path;

  // std::nullopt: duration unknown, playback relies on end-of-media.
  std::optional<int64_t> detected_duration_ms;
};

struct ProgramTrackEntry {
  std::string track_name;
  int play_order = 0;
  int64_t user_start_time_ms = 0;
  std::optional<int64_t> user_end_time_ms;
};

struct AudioProgram {
  std::string program_name;
  std::vector<ProgramTrackEntry> tracks;

  // Takes precedence over loop_count.
  bool loop_indefinitely = false;

  // Additional full passes after the first one.
  int loop_count = 0;
};

inline constexpr float kDefaultProgramVolume = 0.8f;

struct SlideAudioSettings {
  std::optional<std::string> audio_program_name;
  bool loop_audio_program = false;
  int64_t audio_intro_delay_ms = 0;
  int64_t audio_outro_duration_ms = 0;
  float audio_program_volume = kDefaultProgramVolume;
};

// =============================================================================
// Slide
// =============================================================================

struct Slide {
  // Image file names, bottom layer first.
  std::vector<std::string> layers;

  // Seconds. With a text overlay this is the delay before the first sentence.
  int duration = 0;

  // 1-based target slide, 0 = none.
  int loop_to_slide = 0;

  std::optional<TextOverlaySelection> text_overlay;
  SlideAudioSettings audio;
};

// =============================================================================
// Configuration errors
// Never fatal: the feature they affect is treated as absent.
// =============================================================================

enum class ConfigError {
  kNone = 0,

  // Text overlay
  kParagraphMissing,
  kParagraphEmpty,
  kInvalidSentenceRange,
  kSequencerNotReset,

  // Audio
  kProgramMissing,
  kTrackMetadataMissing,
  kMediaMissing,
  kNonPositiveDuration,
  kNoPlayableTracks,
};

const char* ConfigErrorToString(ConfigError error);

}  // namespace alphapresenter::model

#endif  // ALPHAPRESENTER_MODEL_PRESENTATION_TYPES_HPP_
