#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace draughts {

using TimerId = std::uint64_t;

// What the move scheduler needs from the host: one-shot timers, a way to get
// work back onto the host thread, and outstanding-work accounting for tasks
// that will post later.
class TimerHost {
public:
  virtual ~TimerHost() = default;

  virtual TimerId schedule_once(std::chrono::milliseconds delay, std::function<void()> fn) = 0;
  virtual void cancel(TimerId id) = 0;

  // Thread-safe.
  virtual void post(std::function<void()> fn) = 0;
  virtual void work_started() = 0;
  virtual void work_finished() = 0;
};

// Single-threaded cooperative loop. Timers and posted tasks run on whichever
// thread calls poll()/run_until_idle(); post() and the work counters may be
// used from any thread.
class EventLoop : public TimerHost {
public:
  using Clock = std::chrono::steady_clock;

  TimerId schedule_once(std::chrono::milliseconds delay, std::function<void()> fn) override;
  void cancel(TimerId id) override;
  void post(std::function<void()> fn) override;
  void work_started() override;
  void work_finished() override;

  // Runs every posted task and every due timer. Returns how many ran.
  std::size_t poll();

  // Keeps polling, sleeping until the next deadline, until nothing is left
  // (no timers, tasks or outstanding work). Returns false on timeout or stop().
  bool run_until_idle(std::chrono::milliseconds timeout);

  void stop();

  // Queued timers + posted tasks.
  std::size_t pending() const;
  std::size_t outstanding_work() const;

private:
  struct Timer {
    TimerId id = 0;
    Clock::time_point deadline{};
    std::uint64_t seq = 0;   // FIFO among equal deadlines
    std::function<void()> fn;
  };

  bool idle_locked() const { return timers_.empty() && posted_.empty() && work_ == 0; }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<Timer> timers_;
  std::deque<std::function<void()>> posted_;
  TimerId next_id_ = 1;
  std::uint64_t next_seq_ = 0;
  std::size_t work_ = 0;
  bool stopped_ = false;
};

} // namespace draughts
