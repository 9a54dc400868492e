#pragma once
#include "alphapresenter/time/ITimeSource.hpp"

namespace alphapresenter::test_support {

// Virtual clock for tests. Time only moves when the test moves it.
class DeterministicTimeSource : public time::ITimeSource {
public:
  explicit DeterministicTimeSource(int64_t start_ms = 0) : now_ms_(start_ms) {}

  int64_t NowMs() const override { return now_ms_; }

  void AdvanceMs(int64_t delta) { now_ms_ += delta; }

  void SetMs(int64_t value) { now_ms_ = value; }

private:
  int64_t now_ms_;
};

}  // namespace alphapresenter::test_support
