// Repository: AlphaPresenter
// Component: One-Shot Timer
// Purpose: Owned, cancelable single-expiry timer handle bound to an EventLoop.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_RUNTIME_ONE_SHOT_TIMER_HPP_
#define ALPHAPRESENTER_RUNTIME_ONE_SHOT_TIMER_HPP_

#include <cstdint>
#include <functional>

#include "alphapresenter/runtime/EventLoop.hpp"

namespace alphapresenter::runtime {

// At most one shot is pending at a time. Start() replaces any pending shot,
// Cancel() is always safe, and destruction cancels. The callback may destroy
// the timer's owner.
class OneShotTimer {
 public:
  explicit OneShotTimer(EventLoop* loop);
  ~OneShotTimer();

  OneShotTimer(const OneShotTimer&) = delete;
  OneShotTimer& operator=(const OneShotTimer&) = delete;

  void Start(int64_t delay_ms, std::function<void()> on_expiry);
  void Cancel();

  bool IsActive() const { return id_ != EventLoop::kInvalidTimerId; }

 private:
  EventLoop* loop_;
  EventLoop::TimerId id_ = EventLoop::kInvalidTimerId;
};

}  // namespace alphapresenter::runtime

#endif  // ALPHAPRESENTER_RUNTIME_ONE_SHOT_TIMER_HPP_
