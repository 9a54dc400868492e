// Repository: AlphaPresenter
// Component: Slide Transition Coordinator
// Purpose: Per-slide activation of text, audio and the slide countdown, and
//          the advance / loop / hold decision when a slide finishes.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_PRESENTER_SLIDE_TRANSITION_COORDINATOR_HPP_
#define ALPHAPRESENTER_PRESENTER_SLIDE_TRANSITION_COORDINATOR_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "alphapresenter/audio/SlideAudioPlayer.hpp"
#include "alphapresenter/config/PresenterConfig.hpp"
#include "alphapresenter/media/IPlaybackEngine.hpp"
#include "alphapresenter/model/MetadataProviders.hpp"
#include "alphapresenter/model/PresentationTypes.hpp"
#include "alphapresenter/output/IDisplaySink.hpp"
#include "alphapresenter/runtime/EventLoop.hpp"
#include "alphapresenter/runtime/OneShotTimer.hpp"
#include "alphapresenter/text/SentenceSequencer.hpp"

namespace alphapresenter::presenter {

// =============================================================================
// SlideTransitionCoordinator
//
// Activation protocol, run for every slide change (manual or automatic):
//   1. Tear down: reset the sequencer, stop slide audio, cancel the countdown
//      and any deferred navigation, bump the generation. The sequencer and
//      slide audio player are then replaced with fresh instances.
//   2. Show the slide's image layers.
//   3. Load the text overlay, if any.
//   4. duration > 0: arm the countdown. On expiry, text → show first sentence,
//      no text → slide finished. duration == 0 with text: show it now.
//   5. Start slide audio. It runs independently of 3-4.
//
// Slide finished (countdown without text, or the sequencer's auto-advance):
//   loop_to_slide > 0      → activate that slide
//   auto-advancing text    → activate the next slide, if there is one
//   otherwise              → hold on the current slide
// Audio completion never finishes a slide.
//
// Navigation decided inside a timer callback is deferred by one loop turn so
// the slide being left is never torn down from inside its own callback.
// =============================================================================

class SlideTransitionCoordinator {
 public:
  enum class FinishReason {
    kDurationElapsed,
    kTextFinished,
  };

  SlideTransitionCoordinator(runtime::EventLoop* loop,
                             output::IDisplaySink* display,
                             media::IPlaybackEngine* audio_engine,
                             model::Catalog catalog,
                             const config::PresenterConfig& config);
  ~SlideTransitionCoordinator();

  SlideTransitionCoordinator(const SlideTransitionCoordinator&) = delete;
  SlideTransitionCoordinator& operator=(const SlideTransitionCoordinator&) = delete;

  void SetSlideChangedCallback(std::function<void(int index)> on_slide_changed);

  // Clears the display and takes a snapshot of the slides. Nothing is shown
  // until Show() or ActivateSlide().
  void LoadPlaylist(std::vector<model::Slide> slides);

  // 0-based. Returns false for an out-of-range index (nothing changes).
  bool ActivateSlide(int index);

  // Text navigation takes precedence over slide navigation.
  bool Next();
  bool Prev();
  bool CanGoNext() const;
  bool CanGoPrev() const;

  // Activates the current slide, or the first one if none was shown yet.
  bool Show();

  // Tears the active slide down and blanks the display.
  void ClearDisplay();

  int current_index() const { return current_index_; }
  bool IsDisplaying() const { return displaying_; }
  size_t slide_count() const { return slides_.size(); }
  bool HasSlideTimer() const { return slide_timer_.IsActive(); }
  bool HasPendingNavigation() const { return navigation_timer_.IsActive(); }

  const text::SentenceSequencer& sequencer() const { return *sequencer_; }
  const audio::SlideAudioPlayer& slide_audio() const { return *slide_audio_; }

 private:
  void TeardownActiveSlide();
  void CreateSlideComponents();
  void OnSlideTimer(uint64_t generation);
  void OnSlideFinished(FinishReason reason);
  void ScheduleNavigation(int target_index, const char* cause);

  runtime::EventLoop* loop_;
  output::IDisplaySink* display_;
  media::IPlaybackEngine* audio_engine_;
  model::Catalog catalog_;
  const float neutral_volume_;

  // Owned by the active slide. Replaced on every activation.
  std::unique_ptr<text::SentenceSequencer> sequencer_;
  std::unique_ptr<audio::SlideAudioPlayer> slide_audio_;
  runtime::OneShotTimer slide_timer_;
  runtime::OneShotTimer navigation_timer_;

  std::function<void(int)> on_slide_changed_;
  std::vector<model::Slide> slides_;
  int current_index_ = -1;
  bool displaying_ = false;
  uint64_t generation_ = 0;
};

const char* FinishReasonToString(SlideTransitionCoordinator::FinishReason reason);

}  // namespace alphapresenter::presenter

#endif  // ALPHAPRESENTER_PRESENTER_SLIDE_TRANSITION_COORDINATOR_HPP_
