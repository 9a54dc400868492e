// Repository: AlphaPresenter
// Component: Presentation Types
// Purpose: String names for ConfigError.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/model/PresentationTypes.hpp"

namespace alphapresenter::model {

const char* ConfigErrorToString(ConfigError error) {
  switch (error) {
    case ConfigError::kNone: return "NONE";
    case ConfigError::kParagraphMissing: return "PARAGRAPH_MISSING";
    case ConfigError::kParagraphEmpty: return "PARAGRAPH_EMPTY";
    case ConfigError::kInvalidSentenceRange: return "INVALID_SENTENCE_RANGE";
    case ConfigError::kSequencerNotReset: return "SEQUENCER_NOT_RESET";
    case ConfigError::kProgramMissing: return "PROGRAM_MISSING";
    case ConfigError::kTrackMetadataMissing: return "TRACK_METADATA_MISSING";
    case ConfigError::kMediaMissing: return "MEDIA_MISSING";
    case ConfigError::kNonPositiveDuration: return "NON_POSITIVE_DURATION";
    case ConfigError::kNoPlayableTracks: return "NO_PLAYABLE_TRACKS";
  }
  return "UNKNOWN";
}

}  // namespace alphapresenter::model
