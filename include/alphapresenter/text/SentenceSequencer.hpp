// Repository: AlphaPresenter
// Component: Sentence Sequencer
// Purpose: Walks a bounded range of a paragraph's sentences, manually or on
//          per-sentence delay timers, and reports when the last timed
//          sentence has elapsed on an auto-advancing slide.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_TEXT_SENTENCE_SEQUENCER_HPP_
#define ALPHAPRESENTER_TEXT_SENTENCE_SEQUENCER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "alphapresenter/model/PresentationTypes.hpp"
#include "alphapresenter/output/IDisplaySink.hpp"
#include "alphapresenter/runtime/EventLoop.hpp"
#include "alphapresenter/runtime/OneShotTimer.hpp"

namespace alphapresenter::text {

// Longer per-sentence delays are clamped to this before arming the timer.
inline constexpr double kMaxSentenceDelaySeconds = 24.0 * 60.0 * 60.0;

// 0-based inclusive range within a paragraph.
struct SentenceRange {
  bool valid;
  model::ConfigError error;
  int start_index;
  int end_index;

  static SentenceRange Success(int start, int end) {
    return {true, model::ConfigError::kNone, start, end};
  }

  static SentenceRange Failure(model::ConfigError err) {
    return {false, err, -1, -1};
  }
};

class SentenceSequencer {
 public:
  struct LoadResult {
    bool ok;
    model::ConfigError error;
    std::string detail;

    // Seconds to wait before ShowFirst(); the slide's duration.
    double initial_pre_delay_s;

    static LoadResult Success(double pre_delay_s) {
      return {true, model::ConfigError::kNone, "", pre_delay_s};
    }

    static LoadResult Failure(model::ConfigError err, const std::string& detail = "") {
      return {false, err, detail, 0.0};
    }
  };

  SentenceSequencer(runtime::EventLoop* loop, output::IDisplaySink* display);

  SentenceSequencer(const SentenceSequencer&) = delete;
  SentenceSequencer& operator=(const SentenceSequencer&) = delete;

  // Resolves the authored 1-based selection against a paragraph length.
  // "all" resolves to the last sentence.
  static SentenceRange ResolveRange(const model::TextOverlaySelection& selection,
                                    size_t sentence_count);

  // Invoked when the last sentence's timer fires on an auto-advance overlay.
  void SetFinishedCallback(std::function<void()> on_finished);

  // Primes the sequencer at the range start without displaying anything.
  // Fails if the paragraph is missing, the range is invalid, or a paragraph
  // is still loaded (Reset() is never implicit).
  LoadResult Load(const std::optional<model::Paragraph>& paragraph,
                  const model::TextOverlaySelection& selection,
                  double pre_delay_s);

  // Displays the first sentence of the range and arms its timer when timing
  // is enabled. Returns false if nothing is loaded.
  bool ShowFirst();

  // No-op returning false when inactive or at the range end.
  bool ShowNext(bool triggered_by_timer);

  // No-op returning false when inactive or at the range start. Never arms a
  // timer: backward navigation is always manually paced.
  bool ShowPrev();

  void Reset();

  bool HasText() const { return paragraph_.has_value(); }
  bool IsActive() const { return paragraph_.has_value() && current_index_ != -1; }
  bool IsAtStart() const { return IsActive() && current_index_ == start_index_; }
  bool IsAtEnd() const { return IsActive() && current_index_ == end_index_; }
  bool HasPendingTimer() const { return sentence_timer_.IsActive(); }

  int current_index() const { return current_index_; }
  int start_index() const { return start_index_; }
  int end_index() const { return end_index_; }

 private:
  void DisplayCurrent();
  void ArmTimerForCurrent();
  void OnSentenceTimer(uint64_t generation);

  output::IDisplaySink* display_;
  runtime::OneShotTimer sentence_timer_;
  std::function<void()> on_finished_;

  std::optional<model::Paragraph> paragraph_;
  int start_index_ = -1;
  int end_index_ = -1;
  int current_index_ = -1;
  bool timing_enabled_ = false;
  bool auto_advance_ = false;

  // Bumped by Reset(); timer callbacks from an earlier paragraph are ignored.
  uint64_t generation_ = 0;
};

}  // namespace alphapresenter::text

#endif  // ALPHAPRESENTER_TEXT_SENTENCE_SEQUENCER_HPP_
