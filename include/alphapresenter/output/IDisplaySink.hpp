// Repository: AlphaPresenter
// Component: Display Sink Interface
// Purpose: Output surface the core drives: text overlay and image layers.
//          Rendering itself lives outside the core.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_OUTPUT_IDISPLAY_SINK_HPP_
#define ALPHAPRESENTER_OUTPUT_IDISPLAY_SINK_HPP_

#include <string>
#include <vector>

namespace alphapresenter::output {

class IDisplaySink {
 public:
  virtual ~IDisplaySink() = default;

  virtual void DisplayText(const std::string& text) = 0;
  virtual void ClearText() = 0;

  // Bottom layer first. An empty list blanks the image area.
  virtual void DisplayImages(const std::vector<std::string>& layers) = 0;
};

}  // namespace alphapresenter::output

#endif  // ALPHAPRESENTER_OUTPUT_IDISPLAY_SINK_HPP_
