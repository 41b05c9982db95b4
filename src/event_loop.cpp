#include "draughts/event_loop.hpp"

#include <algorithm>
#include <utility>

namespace draughts {

TimerId EventLoop::schedule_once(std::chrono::milliseconds delay, std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(mu_);
  Timer t;
  t.id = next_id_++;
  t.deadline = Clock::now() + std::max(delay, std::chrono::milliseconds(0));
  t.seq = next_seq_++;
  t.fn = std::move(fn);
  timers_.push_back(std::move(t));
  cv_.notify_all();
  return timers_.back().id;
}

void EventLoop::cancel(TimerId id) {
  std::lock_guard<std::mutex> lk(mu_);
  timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                               [id](const Timer& t) { return t.id == id; }),
                timers_.end());
  cv_.notify_all();
}

void EventLoop::post(std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(mu_);
  posted_.push_back(std::move(fn));
  cv_.notify_all();
}

void EventLoop::work_started() {
  std::lock_guard<std::mutex> lk(mu_);
  ++work_;
}

void EventLoop::work_finished() {
  std::lock_guard<std::mutex> lk(mu_);
  if (work_ > 0) --work_;
  cv_.notify_all();
}

std::size_t EventLoop::poll() {
  std::size_t ran = 0;
  for (;;) {
    std::function<void()> fn;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (!posted_.empty()) {
        fn = std::move(posted_.front());
        posted_.pop_front();
      } else {
        const auto now = Clock::now();
        auto due = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
          if (it->deadline > now) continue;
          if (due == timers_.end() || it->deadline < due->deadline ||
              (it->deadline == due->deadline && it->seq < due->seq))
            due = it;
        }
        if (due == timers_.end()) break;
        fn = std::move(due->fn);
        timers_.erase(due);
      }
    }
    // Run outside the lock: callbacks arm timers and post.
    fn();
    ++ran;
  }
  return ran;
}

bool EventLoop::run_until_idle(std::chrono::milliseconds timeout) {
  const auto end = Clock::now() + timeout;
  {
    std::lock_guard<std::mutex> lk(mu_);
    stopped_ = false;
  }

  for (;;) {
    poll();

    std::unique_lock<std::mutex> lk(mu_);
    if (stopped_) return false;
    if (idle_locked()) return true;
    if (!posted_.empty()) continue;

    const auto now = Clock::now();
    if (now >= end) return false;

    auto wake = end;
    for (const auto& t : timers_) wake = std::min(wake, t.deadline);
    if (wake <= now) continue;

    const std::size_t timersBefore = timers_.size();
    cv_.wait_until(lk, wake, [&] {
      return stopped_ || !posted_.empty() || idle_locked() || timers_.size() != timersBefore;
    });
  }
}

void EventLoop::stop() {
  std::lock_guard<std::mutex> lk(mu_);
  stopped_ = true;
  cv_.notify_all();
}

std::size_t EventLoop::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return timers_.size() + posted_.size();
}

std::size_t EventLoop::outstanding_work() const {
  std::lock_guard<std::mutex> lk(mu_);
  return work_;
}

} // namespace draughts
