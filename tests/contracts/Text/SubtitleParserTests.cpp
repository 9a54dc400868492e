// Repository: AlphaPresenter
// Component: Subtitle Parser Contract Tests
// Purpose: Cue delay rounding and SRT / WebVTT / TSV / plain text import.
// Copyright (c) 2025 AlphaPresenter

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "alphapresenter/text/SubtitleParser.hpp"

namespace alphapresenter::text::testing {
namespace {

std::vector<std::string> Texts(const std::vector<model::Sentence>& sentences) {
  std::vector<std::string> texts;
  for (const auto& s : sentences) texts.push_back(s.text);
  return texts;
}

TEST(CueDelay, RoundsUpToTenthOfSecond) {
  EXPECT_DOUBLE_EQ(CueDelaySeconds(0, 1000), 1.0);
  EXPECT_DOUBLE_EQ(CueDelaySeconds(0, 1001), 1.1);
  EXPECT_DOUBLE_EQ(CueDelaySeconds(0, 1050), 1.1);
  EXPECT_DOUBLE_EQ(CueDelaySeconds(1000, 3500), 2.5);
  EXPECT_DOUBLE_EQ(CueDelaySeconds(0, 1), 0.1);
}

TEST(CueDelay, DegenerateCueGetsMinimum) {
  EXPECT_DOUBLE_EQ(CueDelaySeconds(500, 500), 0.1);
  EXPECT_DOUBLE_EQ(CueDelaySeconds(900, 100), 0.1);
}

TEST(SubtitleFormatDetection, ByExtensionIgnoringCase) {
  EXPECT_EQ(DetectSubtitleFormat("talk.srt"), SubtitleFormat::kSrt);
  EXPECT_EQ(DetectSubtitleFormat("dir/Talk.VTT"), SubtitleFormat::kWebVtt);
  EXPECT_EQ(DetectSubtitleFormat("cues.tsv"), SubtitleFormat::kTsv);
  EXPECT_EQ(DetectSubtitleFormat("notes.txt"), SubtitleFormat::kPlainText);
  EXPECT_FALSE(DetectSubtitleFormat("movie.mkv").has_value());
  EXPECT_FALSE(DetectSubtitleFormat("noextension").has_value());
}

TEST(SrtParsing, ParsesCuesWithCrlfAndMultilineText) {
  const std::string srt =
      "1\r\n"
      "00:00:01,000 --> 00:00:03,000\r\n"
      "Hello there.\r\n"
      "\r\n"
      "2\r\n"
      "00:00:03,000 --> 00:00:04,250\r\n"
      "Second line\r\n"
      "continues here.\r\n";

  const auto sentences = ParseSrt(srt);
  ASSERT_EQ(sentences.size(), 2u);
  EXPECT_EQ(sentences[0].text, "Hello there.");
  EXPECT_DOUBLE_EQ(sentences[0].delay_seconds, 2.0);
  EXPECT_EQ(sentences[1].text, "Second line\ncontinues here.");
  EXPECT_DOUBLE_EQ(sentences[1].delay_seconds, 1.3);
}

TEST(SrtParsing, SkipsMalformedBlocks) {
  const std::string srt =
      "1\n"
      "garbage\n"
      "\n"
      "2\n"
      "00:00:xx,000 --> 00:00:02,000\n"
      "Bad time\n"
      "\n"
      "3\n"
      "01:00:00,000 --> 01:00:00,500\n"
      "Kept\n";

  const auto sentences = ParseSrt(srt);
  ASSERT_EQ(sentences.size(), 1u);
  EXPECT_EQ(sentences[0].text, "Kept");
  EXPECT_DOUBLE_EQ(sentences[0].delay_seconds, 0.5);
}

TEST(WebVttParsing, SkipsHeaderNotesAndCueSettings) {
  const std::string vtt =
      "WEBVTT - talk\n"
      "\n"
      "NOTE this is a comment\n"
      "\n"
      "STYLE\n"
      "::cue { color: white }\n"
      "\n"
      "intro\n"
      "00:01.000 --> 00:02.500 align:start position:10%\n"
      "First\n"
      "\n"
      "00:00:02.500 --> 00:00:06.000\n"
      "Second\n";

  const auto sentences = ParseWebVtt(vtt);
  EXPECT_EQ(Texts(sentences), (std::vector<std::string>{"First", "Second"}));
  ASSERT_EQ(sentences.size(), 2u);
  EXPECT_DOUBLE_EQ(sentences[0].delay_seconds, 1.5);
  EXPECT_DOUBLE_EQ(sentences[1].delay_seconds, 3.5);
}

TEST(TsvParsing, SkipsHeaderAndBadLines) {
  const std::string tsv =
      "start\tend\ttext\n"
      "0\t1200\tOne\n"
      "1200\tnope\tBroken\n"
      "only two\tcolumns\n"
      "\n"
      "2000\t2000\tTabbed\ttext\n";

  const auto sentences = ParseTsv(tsv);
  ASSERT_EQ(sentences.size(), 2u);
  EXPECT_EQ(sentences[0].text, "One");
  EXPECT_DOUBLE_EQ(sentences[0].delay_seconds, 1.2);
  EXPECT_EQ(sentences[1].text, "Tabbed\ttext");
  EXPECT_DOUBLE_EQ(sentences[1].delay_seconds, 0.1);
}

TEST(PlainTextParsing, OneManualSentencePerLine) {
  const auto sentences = ParsePlainText("  First line  \n\n\tSecond\r\n");
  EXPECT_EQ(Texts(sentences), (std::vector<std::string>{"First line", "Second"}));
  for (const auto& s : sentences) EXPECT_DOUBLE_EQ(s.delay_seconds, 0.0);
}

TEST(SubtitleFiles, ParagraphNamedAfterFileStem) {
  const std::string path = ::testing::TempDir() + "alphapresenter_welcome.txt";
  {
    std::ofstream out(path);
    out << "Welcome\nEnjoy the show\n";
  }

  SubtitleFileResult result = ParseSubtitleFile(path);
  ASSERT_TRUE(result.ok) << result.error;
  EXPECT_EQ(result.paragraph.name, "alphapresenter_welcome");
  EXPECT_EQ(result.paragraph.sentences.size(), 2u);

  SubtitleFileResult renamed = ParseSubtitleFile(path, "greeting");
  ASSERT_TRUE(renamed.ok);
  EXPECT_EQ(renamed.paragraph.name, "greeting");

  std::remove(path.c_str());
}

TEST(SubtitleFiles, ReportsUnreadableOrEmptyInput) {
  EXPECT_FALSE(ParseSubtitleFile("clip.mp4").ok);
  EXPECT_FALSE(ParseSubtitleFile(::testing::TempDir() + "alphapresenter_missing.srt").ok);

  const std::string path = ::testing::TempDir() + "alphapresenter_blank.txt";
  {
    std::ofstream out(path);
    out << "\n\n";
  }
  SubtitleFileResult result = ParseSubtitleFile(path);
  EXPECT_FALSE(result.ok);
  EXPECT_FALSE(result.error.empty());
  std::remove(path.c_str());
}

}  // namespace
}  // namespace alphapresenter::text::testing
