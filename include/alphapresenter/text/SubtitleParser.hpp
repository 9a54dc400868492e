// Repository: AlphaPresenter
// Component: Subtitle Parser
// Purpose: Imports timed text (SRT, WebVTT, TSV) and plain text as paragraph
//          sentences with per-sentence delays.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_TEXT_SUBTITLE_PARSER_HPP_
#define ALPHAPRESENTER_TEXT_SUBTITLE_PARSER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "alphapresenter/model/PresentationTypes.hpp"

namespace alphapresenter::text {

enum class SubtitleFormat {
  kSrt,
  kWebVtt,
  kTsv,
  kPlainText,
};

const char* SubtitleFormatToString(SubtitleFormat format);

// By extension: .srt .vtt .tsv .txt (case-insensitive).
std::optional<SubtitleFormat> DetectSubtitleFormat(const std::string& path);

// Cue length rounded up to the next 0.1 s. A cue that does not end after it
// starts gets the 0.1 s minimum.
double CueDelaySeconds(int64_t start_ms, int64_t end_ms);

// Malformed cues and lines are skipped with a warning; parsing never fails.
std::vector<model::Sentence> ParseSrt(const std::string& content);
std::vector<model::Sentence> ParseWebVtt(const std::string& content);

// Columns: start_ms, end_ms, text. A header row naming start/end/text is skipped.
std::vector<model::Sentence> ParseTsv(const std::string& content);

// One sentence per non-empty line, delay 0 (manually paced).
std::vector<model::Sentence> ParsePlainText(const std::string& content);

std::vector<model::Sentence> ParseSubtitles(const std::string& content, SubtitleFormat format);

struct SubtitleFileResult {
  bool ok;
  std::string error;
  model::Paragraph paragraph;

  static SubtitleFileResult Success(model::Paragraph p) {
    return {true, "", std::move(p)};
  }

  static SubtitleFileResult Failure(const std::string& err) {
    return {false, err, {}};
  }
};

// Paragraph name defaults to the file stem.
SubtitleFileResult ParseSubtitleFile(const std::string& path,
                                     const std::string& paragraph_name = "");

}  // namespace alphapresenter::text

#endif  // ALPHAPRESENTER_TEXT_SUBTITLE_PARSER_HPP_
