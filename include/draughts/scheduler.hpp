#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <thread>
#include <vector>

#include "draughts/event_loop.hpp"
#include "draughts/rules.hpp"
#include "draughts/search.hpp"

namespace draughts {

struct SchedulerConfig {
  Side automated = Side::B;
  std::chrono::milliseconds first_delay{250};
  std::chrono::milliseconds followup_delay{200};   // between jumps of one chain
  bool background = false;                         // search on a worker thread
  std::uint64_t seed = 0;                          // 0 => std::random_device
};

// Hooks into the host (renderer, turn indicator, game-over scan).
struct SchedulerCallbacks {
  std::function<void()> on_board_changed;
  std::function<void()> on_turn_changed;
  std::function<void()> on_game_over_check;
};

// Plays the automated side on a timer so input and rendering keep running in
// between. At most one timer is armed and at most one background search is
// in flight; results older than the current board are dropped.
// `host` and `rules` must outlive the scheduler.
class MoveScheduler {
public:
  MoveScheduler(TimerHost& host, RuleEngine& rules, SchedulerCallbacks cb,
                SchedulerConfig cfg = {});
  ~MoveScheduler();

  MoveScheduler(const MoveScheduler&) = delete;
  MoveScheduler& operator=(const MoveScheduler&) = delete;

  // Arms the first-move timer if enabled and the automated side is to move.
  void maybe_act_now();

  // Replaces any pending timer with one firing after `delay`.
  void schedule_move(std::chrono::milliseconds delay);

  // Drops the pending timer and invalidates any running background search.
  void cancel();

  void set_enabled(bool on);
  void set_tier(Difficulty d);

  bool enabled() const { return enabled_; }
  Difficulty tier() const { return tier_; }
  Side automated() const { return cfg_.automated; }
  bool timer_pending() const { return timer_.has_value(); }
  bool searching() const { return searching_; }
  std::uint64_t moves_played() const { return moves_played_; }

private:
  void fire();
  void launch_background(Side side, const SearchConfig& sc);
  void on_search_done(std::uint64_t token, std::uint64_t ticket,
                      const std::optional<SearchResult>& r, std::exception_ptr err);
  void play(const std::optional<SearchResult>& r);
  void reap_workers();   // joins only workers that have already finished
  void stop_workers();

  TimerHost& host_;
  RuleEngine& rules_;
  SchedulerCallbacks cb_;
  SchedulerConfig cfg_;

  bool enabled_ = false;
  Difficulty tier_ = Difficulty::Easy;
  std::optional<TimerId> timer_;
  std::mt19937_64 rng_;
  std::uint64_t moves_played_ = 0;

  // Background search bookkeeping. Cancelled searches are told to stop but
  // never waited for on the host thread.
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> stop;
    std::shared_ptr<std::atomic<bool>> done;
  };
  std::vector<Worker> workers_;
  std::uint64_t ticket_ = 0;     // bumped by cancel(); older completions are ignored
  bool searching_ = false;
  std::shared_ptr<int> life_ = std::make_shared<int>(0);
};

} // namespace draughts
