#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "draughts/board.hpp"
#include "draughts/move.hpp"

namespace draughts {

// Score of a position where the side to move has no move left.
constexpr int WIN_SCORE = 100000;

enum class Tier { Random, AlphaBeta };

// Settings-surface names for the automated player.
enum class Difficulty { Off, Easy, Medium, Hard };

struct SearchConfig {
  Tier tier = Tier::Random;
  int depth = 4;             // plies, counting the root move; AlphaBeta only
  std::atomic<bool>* stop = nullptr;  // set => abandon, the result is not used
};

struct SearchResult {
  PlyMove best{};
  int score{0};              // POV = side the move was chosen for; 0 for Random
  std::uint64_t nodes{0};
  int candidates{0};         // size of the root pool
};

// Easy -> Random, Medium -> AlphaBeta(4), Hard -> AlphaBeta(7). Off maps to Easy.
SearchConfig config_for(Difficulty d);

// "off", "easy", "medium", "hard". Throws std::invalid_argument otherwise.
Difficulty parse_difficulty(std::string_view s);
std::string to_string(Difficulty d);

// Picks a move for `side`, or nullopt if it has none.
std::optional<SearchResult> choose_move(const Board& b, Side side,
                                        const SearchConfig& cfg,
                                        std::mt19937_64& rng);

// Fixed-depth minimax value of `b` for `root` with alpha-beta pruning.
// The side to move is b.turn(). Returns alpha early once `stop` is set.
int alphabeta(const Board& b, int depth, int alpha, int beta, Side root,
              std::uint64_t& nodes, std::atomic<bool>* stop = nullptr);

} // namespace draughts
