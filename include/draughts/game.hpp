#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "draughts/board.hpp"
#include "draughts/move.hpp"
#include "draughts/search.hpp"

namespace draughts {

enum class GameOutcome { None, SideAWins, SideBWins };

// Full-board scan: a side with no pieces, or no piece able to move, has lost.
// Side A is looked at first.
GameOutcome check_game_over(const Board& b);

std::string to_string(GameOutcome o);

struct GameReport {
  GameOutcome outcome = GameOutcome::None;
  int plies = 0;                 // moves applied, each jump of a chain counts
  std::vector<PlyMove> moves;    // in play order, from the start position
  std::string reason;            // human-readable termination reason
};

// Both sides automated, played synchronously through RuleEngine::apply.
// - maxPlies: hard cap; a capped game ends with outcome None
// - seed: tie-breaks and the random tier
GameReport selfplay(const Board& start, const SearchConfig& sideA,
                    const SearchConfig& sideB, int maxPlies, std::uint64_t seed);

// Leaf count of the move tree, continuations counted as plies.
// Throws std::invalid_argument on a negative depth.
std::uint64_t perft(const Board& b, int depth);

} // namespace draughts
