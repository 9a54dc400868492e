// Repository: AlphaPresenter
// Component: Playlist Validator
// Purpose: Flags slide configurations that will silently do nothing or
//          degrade at playback time (dead timers, unreachable loops, broken
//          text ranges, unplayable audio).
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_PRESENTER_PLAYLIST_VALIDATOR_HPP_
#define ALPHAPRESENTER_PRESENTER_PLAYLIST_VALIDATOR_HPP_

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "alphapresenter/model/MetadataProviders.hpp"
#include "alphapresenter/model/PresentationTypes.hpp"

namespace alphapresenter::presenter {

enum class IssueKind {
  kTimer,
  kLoop,
  kText,
  kAudio,
};

const char* IssueKindToString(IssueKind kind);

struct SlideIssues {
  size_t index = 0;  // 0-based
  std::set<IssueKind> kinds;
  std::vector<std::string> descriptions;

  bool Has(IssueKind kind) const { return kinds.count(kind) != 0; }
};

// Validation never modifies the playlist and never fails: it only reports.
class PlaylistValidator {
 public:
  explicit PlaylistValidator(model::Catalog catalog);

  // One entry per slide that has at least one issue, in slide order.
  std::vector<SlideIssues> Validate(const std::vector<model::Slide>& slides) const;

 private:
  void CheckTiming(const model::Slide& slide, size_t index, size_t slide_count,
                   SlideIssues& issues) const;
  void CheckTextOverlay(const model::TextOverlaySelection& overlay, SlideIssues& issues) const;
  void CheckAudio(const model::SlideAudioSettings& settings, SlideIssues& issues) const;

  model::Catalog catalog_;
};

}  // namespace alphapresenter::presenter

#endif  // ALPHAPRESENTER_PRESENTER_PLAYLIST_VALIDATOR_HPP_
