// Repository: AlphaPresenter
// Component: Sentence Sequencer
// Purpose: Sentence range navigation and per-sentence delay timers.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/text/SentenceSequencer.hpp"

#include <cmath>
#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::text {

using model::ConfigError;

SentenceSequencer::SentenceSequencer(runtime::EventLoop* loop,
                                     output::IDisplaySink* display)
    : display_(display), sentence_timer_(loop) {}

SentenceRange SentenceSequencer::ResolveRange(
    const model::TextOverlaySelection& selection,
    size_t sentence_count) {
  if (sentence_count == 0) {
    return SentenceRange::Failure(ConfigError::kParagraphEmpty);
  }

  const int count = static_cast<int>(sentence_count);
  const int start = selection.start_sentence - 1;
  const int end = selection.end_sentence.has_value()
                      ? *selection.end_sentence - 1
                      : count - 1;

  if (start < 0 || start >= count || end < start || end >= count) {
    return SentenceRange::Failure(ConfigError::kInvalidSentenceRange);
  }
  return SentenceRange::Success(start, end);
}

void SentenceSequencer::SetFinishedCallback(std::function<void()> on_finished) {
  on_finished_ = std::move(on_finished);
}

SentenceSequencer::LoadResult SentenceSequencer::Load(
    const std::optional<model::Paragraph>& paragraph,
    const model::TextOverlaySelection& selection,
    double pre_delay_s) {
  if (paragraph_.has_value()) {
    std::ostringstream oss;
    oss << "[SentenceSequencer] LOAD_REJECTED paragraph=" << selection.paragraph_name
        << " reason=" << model::ConfigErrorToString(ConfigError::kSequencerNotReset)
        << " loaded=" << paragraph_->name;
    util::Logger::Warn(oss.str());
    return LoadResult::Failure(ConfigError::kSequencerNotReset, paragraph_->name);
  }

  if (!paragraph.has_value()) {
    std::ostringstream oss;
    oss << "[SentenceSequencer] LOAD_FAILED paragraph=" << selection.paragraph_name
        << " reason=" << model::ConfigErrorToString(ConfigError::kParagraphMissing);
    util::Logger::Warn(oss.str());
    return LoadResult::Failure(ConfigError::kParagraphMissing, selection.paragraph_name);
  }

  const SentenceRange range = ResolveRange(selection, paragraph->sentences.size());
  if (!range.valid) {
    std::ostringstream detail;
    detail << "start=" << selection.start_sentence << " end=";
    if (selection.end_sentence.has_value()) {
      detail << *selection.end_sentence;
    } else {
      detail << "all";
    }
    detail << " sentences=" << paragraph->sentences.size();

    std::ostringstream oss;
    oss << "[SentenceSequencer] LOAD_FAILED paragraph=" << selection.paragraph_name
        << " reason=" << model::ConfigErrorToString(range.error) << " " << detail.str();
    util::Logger::Warn(oss.str());
    return LoadResult::Failure(range.error, detail.str());
  }

  paragraph_ = paragraph;
  start_index_ = range.start_index;
  end_index_ = range.end_index;
  current_index_ = -1;
  timing_enabled_ = selection.sentence_timing_enabled;
  auto_advance_ = selection.auto_advance_slide;

  std::ostringstream oss;
  oss << "[SentenceSequencer] LOADED paragraph=" << paragraph_->name
      << " range=" << (start_index_ + 1) << "-" << (end_index_ + 1)
      << " timing=" << (timing_enabled_ ? 1 : 0)
      << " auto_advance=" << (auto_advance_ ? 1 : 0)
      << " pre_delay_s=" << pre_delay_s;
  util::Logger::Info(oss.str());

  return LoadResult::Success(pre_delay_s);
}

bool SentenceSequencer::ShowFirst() {
  if (!paragraph_.has_value()) {
    util::Logger::Debug("[SentenceSequencer] SHOW_FIRST_IGNORED reason=not_loaded");
    return false;
  }
  sentence_timer_.Cancel();
  current_index_ = start_index_;
  DisplayCurrent();
  if (timing_enabled_) ArmTimerForCurrent();
  return true;
}

bool SentenceSequencer::ShowNext(bool triggered_by_timer) {
  if (!IsActive() || IsAtEnd()) {
    std::ostringstream oss;
    oss << "[SentenceSequencer] SHOW_NEXT_IGNORED reason="
        << (IsActive() ? "at_end" : "not_active");
    util::Logger::Debug(oss.str());
    return false;
  }

  sentence_timer_.Cancel();
  ++current_index_;
  DisplayCurrent();

  if (!triggered_by_timer) {
    std::ostringstream oss;
    oss << "[SentenceSequencer] MANUAL_NEXT index=" << current_index_;
    util::Logger::Debug(oss.str());
  }

  // Manual navigation keeps the timed pace going from the new sentence.
  if (timing_enabled_) ArmTimerForCurrent();
  return true;
}

bool SentenceSequencer::ShowPrev() {
  if (!IsActive() || IsAtStart()) {
    std::ostringstream oss;
    oss << "[SentenceSequencer] SHOW_PREV_IGNORED reason="
        << (IsActive() ? "at_start" : "not_active");
    util::Logger::Debug(oss.str());
    return false;
  }

  sentence_timer_.Cancel();
  --current_index_;
  DisplayCurrent();
  return true;
}

void SentenceSequencer::Reset() {
  sentence_timer_.Cancel();
  ++generation_;
  const bool had_text = paragraph_.has_value();
  paragraph_.reset();
  start_index_ = -1;
  end_index_ = -1;
  current_index_ = -1;
  timing_enabled_ = false;
  auto_advance_ = false;
  if (display_) display_->ClearText();
  if (had_text) util::Logger::Debug("[SentenceSequencer] RESET");
}

void SentenceSequencer::DisplayCurrent() {
  const model::Sentence& sentence =
      paragraph_->sentences[static_cast<size_t>(current_index_)];

  std::ostringstream oss;
  oss << "[SentenceSequencer] SHOW index=" << (current_index_ + 1)
      << " delay_s=" << sentence.delay_seconds;
  util::Logger::Info(oss.str());

  if (display_) display_->DisplayText(sentence.text);
}

void SentenceSequencer::ArmTimerForCurrent() {
  double delay_s =
      paragraph_->sentences[static_cast<size_t>(current_index_)].delay_seconds;
  if (!(delay_s > 0.0)) return;

  if (delay_s > kMaxSentenceDelaySeconds) {
    std::ostringstream oss;
    oss << "[SentenceSequencer] DELAY_CLAMPED index=" << (current_index_ + 1)
        << " value_s=" << delay_s << " used_s=" << kMaxSentenceDelaySeconds;
    util::Logger::Warn(oss.str());
    delay_s = kMaxSentenceDelaySeconds;
  }

  const auto delay_ms = static_cast<int64_t>(std::llround(delay_s * 1000.0));
  const uint64_t generation = generation_;
  sentence_timer_.Start(delay_ms, [this, generation]() { OnSentenceTimer(generation); });
}

void SentenceSequencer::OnSentenceTimer(uint64_t generation) {
  if (generation != generation_ || !IsActive()) return;

  if (!IsAtEnd()) {
    ShowNext(/*triggered_by_timer=*/true);
    return;
  }

  if (!auto_advance_) {
    util::Logger::Debug("[SentenceSequencer] LAST_SENTENCE_HOLD");
    return;
  }

  util::Logger::Info("[SentenceSequencer] FINISHED advance_slide=1");
  if (on_finished_) on_finished_();
}

}  // namespace alphapresenter::text
