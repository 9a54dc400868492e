// Repository: AlphaPresenter
// Component: Playlist Validator
// Purpose: Static checks over a playlist snapshot.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/presenter/PlaylistValidator.hpp"

#include <sstream>

#include "alphapresenter/audio/ProgramQueue.hpp"
#include "alphapresenter/text/SentenceSequencer.hpp"
#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::presenter {

namespace {

void AddIssue(SlideIssues& issues, IssueKind kind, const std::string& description) {
  issues.kinds.insert(kind);
  issues.descriptions.push_back(description);
}

bool HasAutoAdvancingText(const model::Slide& slide) {
  return slide.text_overlay.has_value() && slide.text_overlay->sentence_timing_enabled &&
         slide.text_overlay->auto_advance_slide;
}

}  // namespace

const char* IssueKindToString(IssueKind kind) {
  switch (kind) {
    case IssueKind::kTimer: return "timer";
    case IssueKind::kLoop: return "loop";
    case IssueKind::kText: return "text";
    case IssueKind::kAudio: return "audio";
  }
  return "unknown";
}

PlaylistValidator::PlaylistValidator(model::Catalog catalog) : catalog_(catalog) {}

std::vector<SlideIssues> PlaylistValidator::Validate(
    const std::vector<model::Slide>& slides) const {
  std::vector<SlideIssues> found;

  for (size_t i = 0; i < slides.size(); ++i) {
    const model::Slide& slide = slides[i];
    SlideIssues issues;
    issues.index = i;

    CheckTiming(slide, i, slides.size(), issues);
    if (slide.text_overlay) CheckTextOverlay(*slide.text_overlay, issues);
    if (slide.audio.audio_program_name) CheckAudio(slide.audio, issues);

    if (!issues.kinds.empty()) found.push_back(std::move(issues));
  }

  std::ostringstream oss;
  oss << "[PlaylistValidator] VALIDATED slides=" << slides.size()
      << " slides_with_issues=" << found.size();
  util::Logger::Info(oss.str());
  return found;
}

void PlaylistValidator::CheckTiming(const model::Slide& slide,
                                    size_t index,
                                    size_t slide_count,
                                    SlideIssues& issues) const {
  const int self_target = static_cast<int>(index) + 1;

  // A countdown without text only matters if it leads somewhere.
  if (slide.duration > 0 && !slide.text_overlay && slide.loop_to_slide == 0) {
    AddIssue(issues, IssueKind::kTimer, "Timer has no effect (no loop target)");
  }

  if (slide.loop_to_slide > 0 && slide.duration == 0 && !HasAutoAdvancingText(slide)) {
    AddIssue(issues, IssueKind::kLoop, "Inactive loop (0s duration and no auto-advancing text)");
  }

  if (slide.loop_to_slide == self_target && slide_count > 1) {
    // A timed image-only slide looping to itself is a deliberate restart cycle.
    const bool restart_cycle = slide.duration > 0 && !slide.text_overlay;
    if (!restart_cycle) AddIssue(issues, IssueKind::kLoop, "Self loop");
  }

  if (slide.loop_to_slide > static_cast<int>(slide_count)) {
    std::ostringstream desc;
    desc << "Loop target " << slide.loop_to_slide << " out of range (" << slide_count
         << " slides)";
    AddIssue(issues, IssueKind::kLoop, desc.str());
  }
}

void PlaylistValidator::CheckTextOverlay(const model::TextOverlaySelection& overlay,
                                         SlideIssues& issues) const {
  if (overlay.paragraph_name.empty()) {
    AddIssue(issues, IssueKind::kText, "Text overlay has no paragraph");
    return;
  }

  std::optional<model::Paragraph> paragraph;
  if (catalog_.paragraphs) paragraph = catalog_.paragraphs->LoadParagraph(overlay.paragraph_name);
  if (!paragraph) {
    AddIssue(issues, IssueKind::kText, "Paragraph '" + overlay.paragraph_name + "' not found");
    return;
  }

  const text::SentenceRange range =
      text::SentenceSequencer::ResolveRange(overlay, paragraph->sentences.size());
  if (range.valid) return;

  if (range.error == model::ConfigError::kParagraphEmpty) {
    AddIssue(issues, IssueKind::kText, "Paragraph '" + overlay.paragraph_name + "' is empty");
    return;
  }

  std::ostringstream desc;
  desc << "Invalid sentence range " << overlay.start_sentence << "-";
  if (overlay.end_sentence) {
    desc << *overlay.end_sentence;
  } else {
    desc << "all";
  }
  desc << " (" << paragraph->sentences.size() << " sentences)";
  AddIssue(issues, IssueKind::kText, desc.str());
}

void PlaylistValidator::CheckAudio(const model::SlideAudioSettings& settings,
                                   SlideIssues& issues) const {
  const std::string& name = *settings.audio_program_name;

  if (settings.audio_intro_delay_ms < 0 || settings.audio_outro_duration_ms < 0) {
    AddIssue(issues, IssueKind::kAudio, "Negative intro or outro duration");
  }
  if (!(settings.audio_program_volume >= 0.0f && settings.audio_program_volume <= 1.0f)) {
    AddIssue(issues, IssueKind::kAudio, "Volume outside 0..1");
  }

  std::optional<model::AudioProgram> program;
  if (catalog_.programs) program = catalog_.programs->LoadProgram(name);
  if (!program) {
    AddIssue(issues, IssueKind::kAudio, "Audio program '" + name + "' not found");
    return;
  }

  if (catalog_.tracks && catalog_.locator) {
    const audio::ProgramQueue queue =
        audio::BuildProgramQueue(*program, *catalog_.tracks, *catalog_.locator);
    if (queue.tracks.empty()) {
      AddIssue(issues, IssueKind::kAudio, "Audio program '" + name + "' has no playable tracks");
    }
  }
}

}  // namespace alphapresenter::presenter
