// Repository: AlphaPresenter
// Component: Subtitle Parser
// Purpose: SRT / WebVTT / TSV / plain text import.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/text/SubtitleParser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::text {

namespace {

std::string Trim(const std::string& s) {
  const auto first = std::find_if_not(s.begin(), s.end(),
                                      [](unsigned char c) { return std::isspace(c); });
  const auto last = std::find_if_not(s.rbegin(), s.rend(),
                                     [](unsigned char c) { return std::isspace(c); }).base();
  return (first < last) ? std::string(first, last) : std::string();
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> SplitLines(const std::string& content) {
  std::vector<std::string> lines;
  std::istringstream in(content);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

// Runs of non-blank lines, each trimmed.
std::vector<std::vector<std::string>> SplitBlocks(const std::string& content) {
  std::vector<std::vector<std::string>> blocks;
  std::vector<std::string> current;
  for (const auto& raw : SplitLines(content)) {
    std::string line = Trim(raw);
    if (line.empty()) {
      if (!current.empty()) blocks.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(std::move(line));
  }
  if (!current.empty()) blocks.push_back(std::move(current));
  return blocks;
}

std::optional<int64_t> ParseInt64(const std::string& text) {
  const std::string trimmed = Trim(text);
  if (trimmed.empty()) return std::nullopt;
  int64_t value = 0;
  const char* begin = trimmed.data();
  const char* end = begin + trimmed.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) return std::nullopt;
  return value;
}

int64_t ToMs(const std::smatch& m, size_t h, size_t mi, size_t s, size_t ms) {
  const int64_t hours = (h != 0 && m[h].matched) ? std::stoll(m[h].str()) : 0;
  return ((hours * 60 + std::stoll(m[mi].str())) * 60 + std::stoll(m[s].str())) * 1000 +
         std::stoll(m[ms].str());
}

// HH:MM:SS,mmm (a '.' separator is tolerated).
std::optional<int64_t> ParseSrtTimestamp(const std::string& text) {
  static const std::regex kPattern(R"(^(\d{1,2}):(\d{2}):(\d{2})[,.](\d{3})$)");
  std::smatch m;
  if (!std::regex_match(text, m, kPattern)) return std::nullopt;
  return ToMs(m, 1, 2, 3, 4);
}

// HH:MM:SS.mmm or MM:SS.mmm.
std::optional<int64_t> ParseVttTimestamp(const std::string& text) {
  static const std::regex kPattern(R"(^(?:(\d{1,2}):)?(\d{2}):(\d{2})\.(\d{3})$)");
  std::smatch m;
  if (!std::regex_match(text, m, kPattern)) return std::nullopt;
  return ToMs(m, 1, 2, 3, 4);
}

using TimestampParser = std::optional<int64_t> (*)(const std::string&);

// Parses a cue block: optional identifier line(s), one "start --> end [settings]"
// line, then text lines.
std::optional<model::Sentence> ParseCueBlock(const std::vector<std::string>& block,
                                             TimestampParser parse_timestamp,
                                             const char* component) {
  const auto timing = std::find_if(block.begin(), block.end(), [](const std::string& line) {
    return line.find("-->") != std::string::npos;
  });
  if (timing == block.end()) {
    std::ostringstream oss;
    oss << "[" << component << "] CUE_SKIPPED reason=no_timing first_line=" << block.front();
    util::Logger::Warn(oss.str());
    return std::nullopt;
  }

  const size_t arrow = timing->find("-->");
  const std::string start_text = Trim(timing->substr(0, arrow));
  std::istringstream rest(timing->substr(arrow + 3));
  std::string end_text;
  rest >> end_text;  // cue settings after the end timestamp are ignored

  const std::optional<int64_t> start_ms = parse_timestamp(start_text);
  const std::optional<int64_t> end_ms = parse_timestamp(end_text);
  if (!start_ms || !end_ms) {
    std::ostringstream oss;
    oss << "[" << component << "] CUE_SKIPPED reason=bad_timestamp line=" << *timing;
    util::Logger::Warn(oss.str());
    return std::nullopt;
  }

  std::string text;
  for (auto it = timing + 1; it != block.end(); ++it) {
    if (!text.empty()) text += '\n';
    text += *it;
  }
  if (text.empty()) return std::nullopt;

  return model::Sentence{text, CueDelaySeconds(*start_ms, *end_ms)};
}

bool StartsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

}  // namespace

const char* SubtitleFormatToString(SubtitleFormat format) {
  switch (format) {
    case SubtitleFormat::kSrt: return "srt";
    case SubtitleFormat::kWebVtt: return "vtt";
    case SubtitleFormat::kTsv: return "tsv";
    case SubtitleFormat::kPlainText: return "txt";
  }
  return "unknown";
}

std::optional<SubtitleFormat> DetectSubtitleFormat(const std::string& path) {
  const std::string ext = ToLower(std::filesystem::path(path).extension().string());
  if (ext == ".srt") return SubtitleFormat::kSrt;
  if (ext == ".vtt") return SubtitleFormat::kWebVtt;
  if (ext == ".tsv") return SubtitleFormat::kTsv;
  if (ext == ".txt") return SubtitleFormat::kPlainText;
  return std::nullopt;
}

double CueDelaySeconds(int64_t start_ms, int64_t end_ms) {
  if (end_ms <= start_ms) return 0.1;
  const int64_t tenths = (end_ms - start_ms + 99) / 100;
  return static_cast<double>(tenths) / 10.0;
}

std::vector<model::Sentence> ParseSrt(const std::string& content) {
  std::vector<model::Sentence> sentences;
  for (const auto& block : SplitBlocks(content)) {
    if (auto sentence = ParseCueBlock(block, &ParseSrtTimestamp, "SubtitleParser:srt")) {
      sentences.push_back(std::move(*sentence));
    }
  }
  return sentences;
}

std::vector<model::Sentence> ParseWebVtt(const std::string& content) {
  std::vector<model::Sentence> sentences;
  const auto blocks = SplitBlocks(content);
  for (size_t i = 0; i < blocks.size(); ++i) {
    const auto& block = blocks[i];
    if (i == 0 && StartsWith(block.front(), "WEBVTT")) continue;
    if (StartsWith(block.front(), "NOTE") || StartsWith(block.front(), "STYLE") ||
        StartsWith(block.front(), "REGION")) {
      continue;
    }
    if (auto sentence = ParseCueBlock(block, &ParseVttTimestamp, "SubtitleParser:vtt")) {
      sentences.push_back(std::move(*sentence));
    }
  }
  return sentences;
}

std::vector<model::Sentence> ParseTsv(const std::string& content) {
  std::vector<model::Sentence> sentences;
  std::vector<std::string> lines = SplitLines(content);

  size_t first = 0;
  if (!lines.empty()) {
    const std::string header = ToLower(lines.front());
    if (header.find("start") != std::string::npos && header.find("end") != std::string::npos &&
        header.find("text") != std::string::npos) {
      first = 1;
    }
  }

  for (size_t i = first; i < lines.size(); ++i) {
    if (Trim(lines[i]).empty()) continue;

    std::vector<std::string> parts;
    std::string part;
    std::istringstream in(lines[i]);
    while (std::getline(in, part, '\t')) parts.push_back(part);

    if (parts.size() < 3) {
      std::ostringstream oss;
      oss << "[SubtitleParser:tsv] LINE_SKIPPED line=" << (i + 1) << " reason=columns";
      util::Logger::Warn(oss.str());
      continue;
    }

    const std::optional<int64_t> start_ms = ParseInt64(parts[0]);
    const std::optional<int64_t> end_ms = ParseInt64(parts[1]);
    if (!start_ms || !end_ms) {
      std::ostringstream oss;
      oss << "[SubtitleParser:tsv] LINE_SKIPPED line=" << (i + 1) << " reason=time_values";
      util::Logger::Warn(oss.str());
      continue;
    }

    // Text may itself contain tabs.
    std::string text = parts[2];
    for (size_t p = 3; p < parts.size(); ++p) text += "\t" + parts[p];
    text = Trim(text);
    if (text.empty()) continue;

    sentences.push_back(model::Sentence{text, CueDelaySeconds(*start_ms, *end_ms)});
  }
  return sentences;
}

std::vector<model::Sentence> ParsePlainText(const std::string& content) {
  std::vector<model::Sentence> sentences;
  for (const auto& raw : SplitLines(content)) {
    std::string line = Trim(raw);
    if (!line.empty()) sentences.push_back(model::Sentence{std::move(line), 0.0});
  }
  return sentences;
}

std::vector<model::Sentence> ParseSubtitles(const std::string& content, SubtitleFormat format) {
  switch (format) {
    case SubtitleFormat::kSrt: return ParseSrt(content);
    case SubtitleFormat::kWebVtt: return ParseWebVtt(content);
    case SubtitleFormat::kTsv: return ParseTsv(content);
    case SubtitleFormat::kPlainText: return ParsePlainText(content);
  }
  return {};
}

SubtitleFileResult ParseSubtitleFile(const std::string& path,
                                     const std::string& paragraph_name) {
  const std::optional<SubtitleFormat> format = DetectSubtitleFormat(path);
  if (!format) {
    return SubtitleFileResult::Failure("unsupported subtitle extension: " + path);
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    return SubtitleFileResult::Failure("cannot open: " + path);
  }
  std::ostringstream content;
  content << in.rdbuf();

  model::Paragraph paragraph;
  paragraph.name = paragraph_name.empty() ? std::filesystem::path(path).stem().string()
                                          : paragraph_name;
  paragraph.sentences = ParseSubtitles(content.str(), *format);
  if (paragraph.sentences.empty()) {
    return SubtitleFileResult::Failure("no sentences found in " + path);
  }

  std::ostringstream oss;
  oss << "[SubtitleParser] PARSED path=" << path << " format=" << SubtitleFormatToString(*format)
      << " sentences=" << paragraph.sentences.size();
  util::Logger::Info(oss.str());
  return SubtitleFileResult::Success(std::move(paragraph));
}

}  // namespace alphapresenter::text
