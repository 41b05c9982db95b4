#include "draughts/scheduler.hpp"

#include <atomic>
#include <utility>

namespace draughts {

static std::uint64_t initial_seed(std::uint64_t seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

MoveScheduler::MoveScheduler(TimerHost& host, RuleEngine& rules, SchedulerCallbacks cb,
                             SchedulerConfig cfg)
  : host_(host), rules_(rules), cb_(std::move(cb)), cfg_(cfg),
    rng_(initial_seed(cfg.seed)) {}

MoveScheduler::~MoveScheduler() {
  cancel();
  for (auto& w : workers_) w.thread.join();
}

void MoveScheduler::maybe_act_now() {
  if (!enabled_) return;
  if (rules_.turn() != cfg_.automated) return;
  schedule_move(cfg_.first_delay);
}

void MoveScheduler::schedule_move(std::chrono::milliseconds delay) {
  if (timer_) {
    host_.cancel(*timer_);
    timer_.reset();
  }
  timer_ = host_.schedule_once(delay, [this] { fire(); });
}

void MoveScheduler::cancel() {
  if (timer_) {
    host_.cancel(*timer_);
    timer_.reset();
  }
  ++ticket_;
  searching_ = false;
  stop_workers();
}

void MoveScheduler::set_enabled(bool on) {
  enabled_ = on;
  if (!enabled_) cancel();
}

void MoveScheduler::set_tier(Difficulty d) {
  tier_ = d;
}

void MoveScheduler::fire() {
  timer_.reset();

  // The human may have moved for us in the meantime.
  const Side side = cfg_.automated;
  if (rules_.turn() != side) return;

  const SearchConfig sc = config_for(tier_);
  if (cfg_.background) {
    launch_background(side, sc);
    return;
  }
  play(choose_move(rules_.board(), side, sc, rng_));
}

void MoveScheduler::play(const std::optional<SearchResult>& r) {
  if (!r) return; // no move: the game-over scan already reported it

  rules_.apply(r->best);
  ++moves_played_;

  if (cb_.on_board_changed) cb_.on_board_changed();
  if (cb_.on_turn_changed) cb_.on_turn_changed();
  if (cb_.on_game_over_check) cb_.on_game_over_check();

  // Same side still to move: the capture chain continues.
  if (enabled_ && rules_.turn() == cfg_.automated && !timer_)
    schedule_move(cfg_.followup_delay);
}

void MoveScheduler::launch_background(Side side, const SearchConfig& sc) {
  stop_workers();
  reap_workers();
  workers_.reserve(workers_.size() + 1);

  const std::uint64_t token  = rules_.version();
  const std::uint64_t ticket = ++ticket_;
  const std::uint64_t seed   = rng_();
  Board snapshot = rules_.board().clone();

  TimerHost* host = &host_;
  std::weak_ptr<int> life = life_;
  MoveScheduler* self = this;
  auto stop = std::make_shared<std::atomic<bool>>(false);
  auto done = std::make_shared<std::atomic<bool>>(false);

  searching_ = true;
  host->work_started();
  try {
    std::thread t([host, life, self, snapshot, side, sc, seed, token, ticket, stop, done] {
      std::optional<SearchResult> r;
      std::exception_ptr err;
      try {
        SearchConfig cfg = sc;
        cfg.stop = stop.get();
        std::mt19937_64 rng(seed);
        r = choose_move(snapshot, side, cfg, rng);
      } catch (...) {
        err = std::current_exception(); // rethrown on the host thread
      }
      host->post([life, self, token, ticket, r, err] {
        if (life.expired()) return;
        self->on_search_done(token, ticket, r, err);
      });
      host->work_finished();
      done->store(true, std::memory_order_release);
    });
    workers_.push_back(Worker{ std::move(t), std::move(stop), std::move(done) });
  } catch (...) {
    // Thread creation failed: nothing will post back.
    searching_ = false;
    host->work_finished();
    throw;
  }
}

void MoveScheduler::on_search_done(std::uint64_t token, std::uint64_t ticket,
                                   const std::optional<SearchResult>& r,
                                   std::exception_ptr err) {
  if (ticket != ticket_) {
    if (err) std::rethrow_exception(err);
    return; // cancelled while searching
  }
  searching_ = false;
  if (err) std::rethrow_exception(err);

  if (rules_.version() != token) {
    // Board moved on while we were thinking: search again from the new state.
    if (enabled_ && rules_.turn() == cfg_.automated) schedule_move(cfg_.followup_delay);
    return;
  }
  play(r);
}

void MoveScheduler::reap_workers() {
  auto it = workers_.begin();
  while (it != workers_.end()) {
    if (!it->done->load(std::memory_order_acquire)) { ++it; continue; }
    it->thread.join();
    it = workers_.erase(it);
  }
}

void MoveScheduler::stop_workers() {
  for (auto& w : workers_) w.stop->store(true, std::memory_order_relaxed);
}

} // namespace draughts
