// Repository: AlphaPresenter
// Component: Event Loop
// Purpose: Single logical thread on which every timer expiry and engine
//          notification of the orchestration core is delivered.
// Copyright (c) 2025 AlphaPresenter

#ifndef ALPHAPRESENTER_RUNTIME_EVENT_LOOP_HPP_
#define ALPHAPRESENTER_RUNTIME_EVENT_LOOP_HPP_

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

#include "alphapresenter/time/ITimeSource.hpp"

namespace alphapresenter::runtime {

// =============================================================================
// EventLoop
//
// Timers are ordered by (deadline, scheduling sequence). RunDue() executes
// every timer whose deadline has passed, except timers scheduled while the
// pass is running: those wait for the next pass even when their delay is 0.
// This keeps a zero-delay re-schedule from starving the loop and gives
// "advance on next turn" semantics to the players.
//
// Threading: ScheduleAfter/Cancel/RunDue must be called on the loop thread.
// Post() and RequestStop() are safe from any thread; engine backends use
// Post() to marshal their notifications onto the loop.
// =============================================================================

class EventLoop {
 public:
  using TimerId = uint64_t;
  using Task = std::function<void()>;

  static constexpr TimerId kInvalidTimerId = 0;

  explicit EventLoop(std::shared_ptr<time::ITimeSource> time_source);
  ~EventLoop();

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  int64_t NowMs() const;

  // Negative delays are treated as 0.
  TimerId ScheduleAfter(int64_t delay_ms, Task task);

  // Returns true if the timer was still pending. Unknown ids are ignored.
  bool Cancel(TimerId id);

  bool IsPending(TimerId id) const;

  // Thread-safe. Posted tasks run at the start of the next RunDue() pass,
  // in posting order.
  void Post(Task task);

  // Runs posted tasks, then due timers. Returns the number of tasks run.
  size_t RunDue();

  std::optional<int64_t> NextDeadlineMs() const;
  size_t PendingTimers() const { return timers_.size(); }

  // Blocks, running tasks as they become due, until RequestStop().
  void Run();
  void RequestStop();

 private:
  using TimerKey = std::pair<int64_t, TimerId>;

  std::shared_ptr<time::ITimeSource> time_source_;

  // Loop-thread state.
  std::map<TimerKey, Task> timers_;
  std::unordered_map<TimerId, TimerKey> index_;
  TimerId next_id_ = 1;

  // Cross-thread state.
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> posted_;
  bool stop_requested_ = false;
};

}  // namespace alphapresenter::runtime

#endif  // ALPHAPRESENTER_RUNTIME_EVENT_LOOP_HPP_
