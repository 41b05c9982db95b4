#include "draughts/eval.hpp"
#include "draughts/movegen.hpp"
#include "draughts/types.hpp"

#include <vector>

namespace draughts {

static inline int piece_value(Cell c) {
  switch (c) {
    case Cell::ManA:
    case Cell::ManB:  return VAL_MAN;
    case Cell::KingA:
    case Cell::KingB: return VAL_KING;
    default:          return 0;
  }
}

int material(const Board& b, Side root) {
  int score = 0;
  for (int y = 0; y < BOARD_N; ++y)
    for (int x = 0; x < BOARD_N; ++x) {
      const Cell c = b.get(x, y);
      if (c == Cell::Empty) continue;
      const int v = piece_value(c);
      score += belongs_to(c, root) ? v : -v;
    }
  return score;
}

int evaluate(const Board& b, Side root) {
  std::vector<PlyMove> moves;
  collect_moves(b, root, moves);
  const int mine = static_cast<int>(moves.size());
  collect_moves(b, other(root), moves);
  const int theirs = static_cast<int>(moves.size());

  return material(b, root) + MOBILITY_WEIGHT * (mine - theirs);
}

} // namespace draughts
