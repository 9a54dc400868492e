// Repository: AlphaPresenter
// Component: One-Shot Timer
// Purpose: Owned, cancelable single-expiry timer handle bound to an EventLoop.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/runtime/OneShotTimer.hpp"

#include <utility>

namespace alphapresenter::runtime {

OneShotTimer::OneShotTimer(EventLoop* loop) : loop_(loop) {}

OneShotTimer::~OneShotTimer() { Cancel(); }

void OneShotTimer::Start(int64_t delay_ms, std::function<void()> on_expiry) {
  Cancel();
  id_ = loop_->ScheduleAfter(delay_ms, [this, fn = std::move(on_expiry)]() {
    // Clear first: fn may restart this timer or destroy its owner.
    id_ = EventLoop::kInvalidTimerId;
    fn();
  });
}

void OneShotTimer::Cancel() {
  if (id_ != EventLoop::kInvalidTimerId) {
    loop_->Cancel(id_);
    id_ = EventLoop::kInvalidTimerId;
  }
}

}  // namespace alphapresenter::runtime
