// Repository: AlphaPresenter
// Component: Slide Transition Coordinator
// Purpose: Slide activation protocol and slide-finished decisions.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/presenter/SlideTransitionCoordinator.hpp"

#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::presenter {

const char* FinishReasonToString(SlideTransitionCoordinator::FinishReason reason) {
  switch (reason) {
    case SlideTransitionCoordinator::FinishReason::kDurationElapsed: return "duration";
    case SlideTransitionCoordinator::FinishReason::kTextFinished: return "text";
  }
  return "unknown";
}

SlideTransitionCoordinator::SlideTransitionCoordinator(
    runtime::EventLoop* loop,
    output::IDisplaySink* display,
    media::IPlaybackEngine* audio_engine,
    model::Catalog catalog,
    const config::PresenterConfig& config)
    : loop_(loop),
      display_(display),
      audio_engine_(audio_engine),
      catalog_(catalog),
      neutral_volume_(config.neutral_volume),
      slide_timer_(loop),
      navigation_timer_(loop) {
  CreateSlideComponents();
}

SlideTransitionCoordinator::~SlideTransitionCoordinator() {
  TeardownActiveSlide();
}

void SlideTransitionCoordinator::CreateSlideComponents() {
  // The old audio player must be gone before the new one takes the engine's
  // notification callback.
  slide_audio_.reset();
  sequencer_.reset();

  sequencer_ = std::make_unique<text::SentenceSequencer>(loop_, display_);
  sequencer_->SetFinishedCallback(
      [this]() { OnSlideFinished(FinishReason::kTextFinished); });

  slide_audio_ = std::make_unique<audio::SlideAudioPlayer>(loop_, audio_engine_, catalog_,
                                                           neutral_volume_);

  audio::SlideAudioPlayer::Callbacks audio_cb;
  audio_cb.on_audio_finished = [this]() {
    std::ostringstream oss;
    oss << "[SlideTransitionCoordinator] AUDIO_FINISHED slide=" << (current_index_ + 1)
        << " action=none";
    util::Logger::Debug(oss.str());
  };
  audio_cb.on_error = [this](const std::string& message) {
    std::ostringstream oss;
    oss << "[SlideTransitionCoordinator] AUDIO_ERROR slide=" << (current_index_ + 1)
        << " message=" << message;
    util::Logger::Warn(oss.str());
  };
  slide_audio_->SetCallbacks(std::move(audio_cb));
}

void SlideTransitionCoordinator::SetSlideChangedCallback(
    std::function<void(int index)> on_slide_changed) {
  on_slide_changed_ = std::move(on_slide_changed);
}

void SlideTransitionCoordinator::LoadPlaylist(std::vector<model::Slide> slides) {
  ClearDisplay();
  slides_ = std::move(slides);
  current_index_ = slides_.empty() ? -1 : 0;

  std::ostringstream oss;
  oss << "[SlideTransitionCoordinator] PLAYLIST_LOADED slides=" << slides_.size();
  util::Logger::Info(oss.str());
}

// =============================================================================
// Activation
// =============================================================================

void SlideTransitionCoordinator::TeardownActiveSlide() {
  sequencer_->Reset();
  slide_audio_->Stop();
  slide_timer_.Cancel();
  navigation_timer_.Cancel();
  ++generation_;
}

bool SlideTransitionCoordinator::ActivateSlide(int index) {
  if (index < 0 || index >= static_cast<int>(slides_.size())) {
    std::ostringstream oss;
    oss << "[SlideTransitionCoordinator] ACTIVATE_REJECTED index=" << index
        << " slides=" << slides_.size();
    util::Logger::Warn(oss.str());
    return false;
  }

  TeardownActiveSlide();
  CreateSlideComponents();
  const uint64_t generation = generation_;

  current_index_ = index;
  displaying_ = true;
  const model::Slide& slide = slides_[static_cast<size_t>(index)];

  {
    std::ostringstream oss;
    oss << "[SlideTransitionCoordinator] ACTIVATE slide=" << (index + 1)
        << " layers=" << slide.layers.size() << " duration_s=" << slide.duration
        << " loop_to=" << slide.loop_to_slide
        << " text=" << (slide.text_overlay ? 1 : 0)
        << " audio=" << (slide.audio.audio_program_name ? 1 : 0);
    util::Logger::Info(oss.str());
  }

  display_->DisplayImages(slide.layers);

  bool text_loaded = false;
  if (slide.text_overlay) {
    std::optional<model::Paragraph> paragraph;
    if (catalog_.paragraphs) {
      paragraph = catalog_.paragraphs->LoadParagraph(slide.text_overlay->paragraph_name);
    }
    const text::SentenceSequencer::LoadResult result =
        sequencer_->Load(paragraph, *slide.text_overlay, static_cast<double>(slide.duration));
    text_loaded = result.ok;
    if (!text_loaded) {
      std::ostringstream oss;
      oss << "[SlideTransitionCoordinator] TEXT_ABSENT slide=" << (index + 1)
          << " reason=" << model::ConfigErrorToString(result.error);
      util::Logger::Warn(oss.str());
    }
  }

  // With text the duration is the pre-text delay; without, a plain countdown.
  if (slide.duration > 0) {
    const int64_t delay_ms = static_cast<int64_t>(slide.duration) * 1000;
    slide_timer_.Start(delay_ms, [this, generation]() { OnSlideTimer(generation); });
  } else if (text_loaded) {
    sequencer_->ShowFirst();
  }

  if (slide.audio.audio_program_name && !slide_audio_->LoadAndPlay(slide.audio)) {
    std::ostringstream oss;
    oss << "[SlideTransitionCoordinator] AUDIO_ABSENT slide=" << (index + 1);
    util::Logger::Debug(oss.str());
  }

  if (on_slide_changed_) on_slide_changed_(index);
  return true;
}

void SlideTransitionCoordinator::OnSlideTimer(uint64_t generation) {
  if (generation != generation_) return;

  if (sequencer_->HasText()) {
    sequencer_->ShowFirst();
    return;
  }
  OnSlideFinished(FinishReason::kDurationElapsed);
}

void SlideTransitionCoordinator::OnSlideFinished(FinishReason reason) {
  if (current_index_ < 0) return;
  const model::Slide& slide = slides_[static_cast<size_t>(current_index_)];
  const int slide_count = static_cast<int>(slides_.size());

  std::ostringstream oss;
  oss << "[SlideTransitionCoordinator] SLIDE_FINISHED slide=" << (current_index_ + 1)
      << " reason=" << FinishReasonToString(reason);
  util::Logger::Info(oss.str());

  if (slide.loop_to_slide > 0) {
    const int target = slide.loop_to_slide - 1;
    if (target >= slide_count) {
      std::ostringstream warn;
      warn << "[SlideTransitionCoordinator] LOOP_TARGET_INVALID slide=" << (current_index_ + 1)
           << " loop_to=" << slide.loop_to_slide << " slides=" << slide_count;
      util::Logger::Warn(warn.str());
      return;
    }
    ScheduleNavigation(target, "loop");
    return;
  }

  // The sequencer only reports finished when auto_advance_slide is set.
  if (reason == FinishReason::kTextFinished) {
    if (current_index_ + 1 < slide_count) {
      ScheduleNavigation(current_index_ + 1, "auto_advance");
    } else {
      util::Logger::Info("[SlideTransitionCoordinator] HOLD reason=end_of_playlist");
    }
    return;
  }

  util::Logger::Debug("[SlideTransitionCoordinator] HOLD reason=no_loop_target");
}

void SlideTransitionCoordinator::ScheduleNavigation(int target_index, const char* cause) {
  std::ostringstream oss;
  oss << "[SlideTransitionCoordinator] NAVIGATE_SCHEDULED from=" << (current_index_ + 1)
      << " to=" << (target_index + 1) << " cause=" << cause;
  util::Logger::Info(oss.str());

  const uint64_t generation = generation_;
  navigation_timer_.Start(0, [this, generation, target_index]() {
    if (generation != generation_) return;
    ActivateSlide(target_index);
  });
}

// =============================================================================
// Manual navigation
// =============================================================================

bool SlideTransitionCoordinator::Next() {
  if (sequencer_->IsActive() && !sequencer_->IsAtEnd()) {
    return sequencer_->ShowNext(/*triggered_by_timer=*/false);
  }
  if (current_index_ + 1 < static_cast<int>(slides_.size())) {
    return ActivateSlide(current_index_ + 1);
  }
  return false;
}

bool SlideTransitionCoordinator::Prev() {
  if (sequencer_->IsActive() && !sequencer_->IsAtStart()) {
    return sequencer_->ShowPrev();
  }
  if (current_index_ > 0) {
    return ActivateSlide(current_index_ - 1);
  }
  return false;
}

bool SlideTransitionCoordinator::CanGoNext() const {
  if (sequencer_->IsActive() && !sequencer_->IsAtEnd()) return true;
  return current_index_ + 1 < static_cast<int>(slides_.size());
}

bool SlideTransitionCoordinator::CanGoPrev() const {
  if (sequencer_->IsActive() && !sequencer_->IsAtStart()) return true;
  return current_index_ > 0;
}

bool SlideTransitionCoordinator::Show() {
  if (slides_.empty()) return false;
  return ActivateSlide(current_index_ < 0 ? 0 : current_index_);
}

void SlideTransitionCoordinator::ClearDisplay() {
  TeardownActiveSlide();
  display_->ClearText();
  display_->DisplayImages({});
  if (displaying_) util::Logger::Info("[SlideTransitionCoordinator] DISPLAY_CLEARED");
  displaying_ = false;
}

}  // namespace alphapresenter::presenter
