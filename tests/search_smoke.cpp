#include <algorithm>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>
#include "draughts/board.hpp"
#include "draughts/layout.hpp"
#include "draughts/movegen.hpp"
#include "draughts/rules.hpp"
#include "draughts/eval.hpp"
#include "draughts/search.hpp"

using namespace draughts;

// Plain minimax, no pruning.
static int minimax(const Board& b, int depth, Side root) {
  const auto moves = collect_moves(b, b.turn());
  if (moves.empty()) return b.turn() == root ? -WIN_SCORE : WIN_SCORE;
  if (depth <= 0) return evaluate(b, root);

  const bool maxing = b.turn() == root;
  int best = maxing ? -2 * WIN_SCORE : 2 * WIN_SCORE;
  for (const auto& m : moves) {
    Board child = b.clone();
    apply_move(child, m);
    const int v = minimax(child, depth - 1, root);
    best = maxing ? std::max(best, v) : std::min(best, v);
  }
  return best;
}

static bool contains(const std::vector<PlyMove>& v, const PlyMove& m) {
  for (const auto& x : v) if (same_move(x, m)) return true;
  return false;
}

int main() {
  // Difficulty mapping
  assert(config_for(Difficulty::Easy).tier == Tier::Random);
  assert(config_for(Difficulty::Off).tier == Tier::Random);
  assert(config_for(Difficulty::Medium).tier == Tier::AlphaBeta);
  assert(config_for(Difficulty::Medium).depth == 4);
  assert(config_for(Difficulty::Hard).depth == 7);
  for (Difficulty d : {Difficulty::Off, Difficulty::Easy, Difficulty::Medium, Difficulty::Hard})
    assert(parse_difficulty(to_string(d)) == d);
  bool threw = false;
  try { (void)parse_difficulty("expert"); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // Random tier always returns a legal move
  {
    Board b;
    const auto legal = collect_moves(b, Side::A);
    for (std::uint64_t seed = 1; seed <= 20; ++seed) {
      std::mt19937_64 rng(seed);
      auto r = choose_move(b, Side::A, SearchConfig{ Tier::Random, 0 }, rng);
      assert(r);
      assert(contains(legal, r->best));
      assert(r->candidates == 7);
    }
  }

  // ... and takes the capture when there is one
  {
    Board b = board_from_layout(".b...b../......../...b..../....a.../......../......../......../a....... b");
    for (std::uint64_t seed = 1; seed <= 20; ++seed) {
      std::mt19937_64 rng(seed);
      auto r = choose_move(b, Side::B, SearchConfig{ Tier::Random, 0 }, rng);
      assert(r);
      assert(r->best.from == (Coord{3, 2}));
      assert(r->best.move.to == (Coord{5, 4}));
      assert(r->best.move.capture);
    }
  }

  // No pieces or no moves: nothing to choose
  {
    std::mt19937_64 rng(1);
    Board none = board_from_layout("......../......../......../......../......../..a...../......../........ b");
    assert(!choose_move(none, Side::B, config_for(Difficulty::Easy), rng));
    assert(!choose_move(none, Side::B, config_for(Difficulty::Medium), rng));
    Board stuck = board_from_layout("b.b...../.a....../......../......../......../......../......../........ a");
    assert(!choose_move(stuck, Side::A, config_for(Difficulty::Hard), rng));
  }

  // Pruning never changes the value
  {
    const Board start;
    const Board mid = board_from_layout(".....B../......../.b.b..../......../.......b/..a.a.../......../......A. a");
    for (int d = 1; d <= 3; ++d) {
      std::uint64_t nodes = 0;
      assert(alphabeta(start, d, -1'000'000, 1'000'000, Side::A, nodes) == minimax(start, d, Side::A));
      assert(nodes > 0);
    }
    for (int d = 1; d <= 4; ++d) {
      std::uint64_t nodes = 0;
      assert(alphabeta(mid, d, -1'000'000, 1'000'000, Side::A, nodes) == minimax(mid, d, Side::A));
      nodes = 0;
      assert(alphabeta(mid, d, -1'000'000, 1'000'000, Side::B, nodes) == minimax(mid, d, Side::B));
    }

    // Root: best score over candidates, best move among those reaching it
    std::mt19937_64 rng(5);
    const Board copy = mid;
    auto r = choose_move(mid, Side::A, SearchConfig{ Tier::AlphaBeta, 3 }, rng);
    assert(r);
    assert(mid == copy);
    int best = -2 * WIN_SCORE;
    for (const auto& m : collect_moves(mid, Side::A)) {
      Board child = mid.clone();
      apply_move(child, m);
      best = std::max(best, minimax(child, 2, Side::A));
    }
    assert(r->score == best);
    Board child = mid.clone();
    apply_move(child, r->best);
    assert(minimax(child, 2, Side::A) == best);
  }

  // Walking into a forced capture that loses the last piece is avoided
  {
    Board b = board_from_layout("......../......../...b..../......../.....a../......../......../........ b");
    for (int d : {2, 4}) {
      std::mt19937_64 rng(9);
      auto r = choose_move(b, Side::B, SearchConfig{ Tier::AlphaBeta, d }, rng);
      assert(r);
      assert(r->best.move.to == (Coord{2, 3}));
      assert(r->score > -WIN_SCORE);
    }
  }

  // A raised stop flag cuts a deep search short but still yields a legal move
  {
    const Board start;
    std::atomic<bool> stop{true};
    SearchConfig cfg = config_for(Difficulty::Hard);
    cfg.stop = &stop;
    std::mt19937_64 rng(2);
    auto r = choose_move(start, Side::A, cfg, rng);
    assert(r);
    assert(contains(collect_moves(start, Side::A), r->best));
    assert(r->nodes < 5000);
  }

  // Winning capture is scored as a win
  {
    Board b = board_from_layout("......../......../......../......../.b....../..a...../......../........ a");
    std::mt19937_64 rng(1);
    auto r = choose_move(b, Side::A, SearchConfig{ Tier::AlphaBeta, 2 }, rng);
    assert(r);
    assert(r->best.move.capture);
    assert(r->score == WIN_SCORE);
  }

  return 0;
}
