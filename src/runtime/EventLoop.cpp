// Repository: AlphaPresenter
// Component: Event Loop
// Purpose: Deadline-ordered timer dispatch on a single logical thread.
// Copyright (c) 2025 AlphaPresenter

#include "alphapresenter/runtime/EventLoop.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

#include "alphapresenter/util/Logger.hpp"

namespace alphapresenter::runtime {

EventLoop::EventLoop(std::shared_ptr<time::ITimeSource> time_source)
    : time_source_(std::move(time_source)) {}

EventLoop::~EventLoop() {
  if (!timers_.empty()) {
    std::ostringstream oss;
    oss << "[EventLoop] DESTROY pending_timers=" << timers_.size();
    util::Logger::Debug(oss.str());
  }
}

int64_t EventLoop::NowMs() const { return time_source_->NowMs(); }

EventLoop::TimerId EventLoop::ScheduleAfter(int64_t delay_ms, Task task) {
  const TimerId id = next_id_++;
  const TimerKey key{NowMs() + std::max<int64_t>(0, delay_ms), id};
  timers_.emplace(key, std::move(task));
  index_.emplace(id, key);
  return id;
}

bool EventLoop::Cancel(TimerId id) {
  auto it = index_.find(id);
  if (it == index_.end()) return false;
  timers_.erase(it->second);
  index_.erase(it);
  return true;
}

bool EventLoop::IsPending(TimerId id) const {
  return index_.find(id) != index_.end();
}

void EventLoop::Post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    posted_.push_back(std::move(task));
  }
  cv_.notify_one();
}

size_t EventLoop::RunDue() {
  size_t ran = 0;
  // Timers scheduled from here on, by posted tasks included, wait for the
  // next pass.
  const TimerId pass_limit = next_id_;

  std::deque<Task> posted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    posted.swap(posted_);
  }
  for (auto& task : posted) {
    task();
    ++ran;
  }

  const int64_t now = NowMs();

  while (true) {
    auto it = timers_.begin();
    while (it != timers_.end() && it->first.first <= now &&
           it->first.second >= pass_limit) {
      ++it;
    }
    if (it == timers_.end() || it->first.first > now) break;

    // The task may cancel or schedule other timers, or destroy the object that
    // scheduled it, so take ownership before running.
    Task task = std::move(it->second);
    index_.erase(it->first.second);
    timers_.erase(it);
    task();
    ++ran;
  }

  return ran;
}

std::optional<int64_t> EventLoop::NextDeadlineMs() const {
  if (timers_.empty()) return std::nullopt;
  return timers_.begin()->first.first;
}

void EventLoop::Run() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  util::Logger::Debug("[EventLoop] RUN_START");

  while (true) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stop_requested_) break;
    }

    RunDue();

    const std::optional<int64_t> next = NextDeadlineMs();
    std::unique_lock<std::mutex> lock(mutex_);
    auto wake = [this] { return stop_requested_ || !posted_.empty(); };
    if (wake()) continue;
    if (next.has_value()) {
      const int64_t wait_ms = std::max<int64_t>(0, *next - NowMs());
      cv_.wait_for(lock, std::chrono::milliseconds(wait_ms), wake);
    } else {
      cv_.wait(lock, wake);
    }
  }

  util::Logger::Debug("[EventLoop] RUN_STOP");
}

void EventLoop::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
}

}  // namespace alphapresenter::runtime
