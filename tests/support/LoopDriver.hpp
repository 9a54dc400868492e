// Loop Driver: deterministic time stepping for orchestration tests.
//
// Owns a DeterministicTimeSource and an EventLoop on it. AdvanceMs() walks the
// virtual clock from deadline to deadline, running everything due at each
// step, so timers fire at exactly their scheduled virtual time and in the
// same order the production loop would run them.

#pragma once

#include <cstdint>
#include <memory>

#include "DeterministicTimeSource.hpp"
#include "alphapresenter/runtime/EventLoop.hpp"

namespace alphapresenter::test_support {

class LoopDriver {
public:
  explicit LoopDriver(int64_t start_ms = 0)
      : clock_(std::make_shared<DeterministicTimeSource>(start_ms)),
        loop_(clock_) {}

  runtime::EventLoop* loop() { return &loop_; }
  DeterministicTimeSource& clock() { return *clock_; }
  int64_t NowMs() const { return clock_->NowMs(); }

  // Runs passes at the current time until nothing is due. max_passes bounds
  // programs that re-schedule themselves forever.
  size_t Drain(int max_passes = 1000) {
    size_t total = 0;
    for (int i = 0; i < max_passes; ++i) {
      const size_t ran = loop_.RunDue();
      if (ran == 0) break;
      total += ran;
    }
    return total;
  }

  void AdvanceMs(int64_t delta_ms) {
    const int64_t target = clock_->NowMs() + delta_ms;
    Drain();
    // Bounded so a program that re-schedules forever cannot hang a test.
    for (int step = 0; step < 100000; ++step) {
      auto next = loop_.NextDeadlineMs();
      if (!next || *next > target) break;
      if (*next > clock_->NowMs()) clock_->SetMs(*next);
      if (Drain() == 0) break;
    }
    clock_->SetMs(target);
    Drain();
  }

private:
  std::shared_ptr<DeterministicTimeSource> clock_;
  runtime::EventLoop loop_;
};

}  // namespace alphapresenter::test_support
