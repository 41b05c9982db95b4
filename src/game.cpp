#include "draughts/game.hpp"

#include "draughts/movegen.hpp"
#include "draughts/rules.hpp"

#include <initializer_list>
#include <random>
#include <stdexcept>
#include <vector>

namespace draughts {
namespace {

static inline GameOutcome winner_against(Side loser) {
  return loser == Side::A ? GameOutcome::SideBWins : GameOutcome::SideAWins;
}

static std::uint64_t perft_rec(const Board& b, int depth) {
  if (depth == 0) return 1ULL;

  std::vector<PlyMove> moves;
  collect_moves(b, b.turn(), moves);

  std::uint64_t nodes = 0ULL;
  for (const auto& m : moves) {
    Board child = b.clone();
    apply_move(child, m);
    nodes += perft_rec(child, depth - 1);
  }
  return nodes;
}

} // namespace

GameOutcome check_game_over(const Board& b) {
  for (Side s : {Side::A, Side::B}) {
    if (b.count_pieces(s) == 0 || !has_any_moves(b, s)) return winner_against(s);
  }
  return GameOutcome::None;
}

std::string to_string(GameOutcome o) {
  switch (o) {
    case GameOutcome::SideAWins: return "a";
    case GameOutcome::SideBWins: return "b";
    case GameOutcome::None:      return "none";
  }
  return "none";
}

GameReport selfplay(const Board& start, const SearchConfig& sideA,
                    const SearchConfig& sideB, int maxPlies, std::uint64_t seed) {
  GameReport out{};
  RuleEngine rules;
  rules.load(start);
  std::mt19937_64 rng(seed);

  if (maxPlies < 0) maxPlies = 0;

  for (int ply = 0; ply < maxPlies; ++ply) {
    const GameOutcome o = check_game_over(rules.board());
    if (o != GameOutcome::None) {
      out.outcome = o;
      out.reason = "no pieces or no movable piece";
      break;
    }

    const Side us = rules.turn();
    const SearchConfig& cfg = (us == Side::A) ? sideA : sideB;
    auto r = choose_move(rules.board(), us, cfg, rng);

    // Robustness: the scan above should already have ended the game.
    if (!r) {
      out.outcome = winner_against(us);
      out.reason = "no legal move";
      break;
    }

    rules.apply(r->best);
    out.moves.push_back(r->best);
  }

  out.plies = static_cast<int>(out.moves.size());

  if (out.reason.empty()) {
    const GameOutcome o = check_game_over(rules.board());
    if (o != GameOutcome::None) {
      out.outcome = o;
      out.reason = "no pieces or no movable piece";
    } else {
      out.reason = "max plies reached";
    }
  }
  return out;
}

std::uint64_t perft(const Board& b, int depth) {
  if (depth < 0) throw std::invalid_argument("perft: negative depth");
  return perft_rec(b, depth);
}

} // namespace draughts
