#include "draughts/search.hpp"
#include "draughts/movegen.hpp"
#include "draughts/rules.hpp"
#include "draughts/eval.hpp"
#include "draughts/types.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace draughts {
namespace {

// -----------------------------------------------------------------------------
// Tunables
// -----------------------------------------------------------------------------
constexpr int INF = 1'000'000;
constexpr int MEDIUM_DEPTH = 4;
constexpr int HARD_DEPTH   = 7;

template <class T>
const T& pick_uniform(const std::vector<T>& v, std::mt19937_64& rng) {
  std::uniform_int_distribution<std::size_t> dist(0, v.size() - 1);
  return v[dist(rng)];
}

// -----------------------------------------------------------------------------
// Random tier: captures first, otherwise anything
// -----------------------------------------------------------------------------
SearchResult choose_random(const std::vector<PlyMove>& moves, std::mt19937_64& rng) {
  std::vector<PlyMove> jumps;
  for (const auto& m : moves)
    if (m.move.capture) jumps.push_back(m);

  const auto& pool = jumps.empty() ? moves : jumps;

  SearchResult res{};
  res.best = pick_uniform(pool, rng);
  res.candidates = static_cast<int>(moves.size());
  return res;
}

// -----------------------------------------------------------------------------
// AlphaBeta tier: score every root candidate on a clone, random among the best
// -----------------------------------------------------------------------------
SearchResult choose_alphabeta(const Board& b, Side side, int depth,
                              const std::vector<PlyMove>& moves,
                              std::mt19937_64& rng, std::atomic<bool>* stop) {
  SearchResult res{};
  res.candidates = static_cast<int>(moves.size());

  int bestScore = -INF;
  std::vector<PlyMove> bestMoves;

  for (const auto& m : moves) {
    Board child = b.clone();
    apply_move(child, m);
    const int score = alphabeta(child, depth - 1, -INF, +INF, side, res.nodes, stop);
    if (score > bestScore) {
      bestScore = score;
      bestMoves.clear();
      bestMoves.push_back(m);
    } else if (score == bestScore) {
      bestMoves.push_back(m);
    }
    if (stop && stop->load(std::memory_order_relaxed)) break;
  }

  res.best  = pick_uniform(bestMoves, rng);
  res.score = bestScore;
  return res;
}

} // namespace

// ============================================================================
// Minimax with alpha-beta (root POV, not negamax)
// ============================================================================
int alphabeta(const Board& b, int depth, int alpha, int beta, Side root,
              std::uint64_t& nodes, std::atomic<bool>* stop) {
  nodes++;
  if (stop && (nodes & 0x3FF) == 0 && stop->load(std::memory_order_relaxed))
    return alpha;

  const Side us = b.turn();
  std::vector<PlyMove> moves;
  collect_moves(b, us, moves);

  // Out of moves = lost, checked before the depth cutoff.
  if (moves.empty()) return us == root ? -WIN_SCORE : WIN_SCORE;
  if (depth <= 0) return evaluate(b, root);

  if (us == root) {
    int value = -INF;
    for (const auto& m : moves) {
      Board child = b.clone();
      apply_move(child, m);
      value = std::max(value, alphabeta(child, depth - 1, alpha, beta, root, nodes, stop));
      alpha = std::max(alpha, value);
      if (alpha >= beta) break;
      if (stop && stop->load(std::memory_order_relaxed)) break;
    }
    return value;
  }

  int value = +INF;
  for (const auto& m : moves) {
    Board child = b.clone();
    apply_move(child, m);
    value = std::min(value, alphabeta(child, depth - 1, alpha, beta, root, nodes, stop));
    beta = std::min(beta, value);
    if (alpha >= beta) break;
    if (stop && stop->load(std::memory_order_relaxed)) break;
  }
  return value;
}

// ============================================================================
// Public entry points
// ============================================================================
std::optional<SearchResult> choose_move(const Board& b, Side side,
                                        const SearchConfig& cfg,
                                        std::mt19937_64& rng) {
  const std::vector<PlyMove> moves = collect_moves(b, side);
  if (moves.empty()) return std::nullopt;

  if (cfg.tier == Tier::AlphaBeta)
    return choose_alphabeta(b, side, std::max(1, cfg.depth), moves, rng, cfg.stop);
  return choose_random(moves, rng);
}

SearchConfig config_for(Difficulty d) {
  switch (d) {
    case Difficulty::Medium: return SearchConfig{ Tier::AlphaBeta, MEDIUM_DEPTH };
    case Difficulty::Hard:   return SearchConfig{ Tier::AlphaBeta, HARD_DEPTH };
    case Difficulty::Off:
    case Difficulty::Easy:
    default:                 return SearchConfig{ Tier::Random, 0 };
  }
}

Difficulty parse_difficulty(std::string_view s) {
  if (s == "off")    return Difficulty::Off;
  if (s == "easy")   return Difficulty::Easy;
  if (s == "medium") return Difficulty::Medium;
  if (s == "hard")   return Difficulty::Hard;
  throw std::invalid_argument("unknown difficulty: " + std::string(s));
}

std::string to_string(Difficulty d) {
  switch (d) {
    case Difficulty::Off:    return "off";
    case Difficulty::Easy:   return "easy";
    case Difficulty::Medium: return "medium";
    case Difficulty::Hard:   return "hard";
  }
  return "off";
}

} // namespace draughts
