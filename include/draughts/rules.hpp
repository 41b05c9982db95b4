#pragma once
#include <cstdint>
#include <stdexcept>
#include "draughts/board.hpp"
#include "draughts/move.hpp"

namespace draughts {

// Raised when a move contradicts what move generation can produce.
struct RuleError : std::logic_error { using std::logic_error::logic_error; };

// Plays `m` for the piece on (sx, sy) and lands it on (tx, ty).
// Returns true if the turn passed to the other side, false if the piece
// captured and can capture again (selection then marks the landing square).
bool apply_move(Board& b, int sx, int sy, int tx, int ty, const Move& m);

inline bool apply_move(Board& b, const PlyMove& pm) {
  return apply_move(b, pm.from.x, pm.from.y, pm.move.to.x, pm.move.to.y, pm.move);
}

// Owner of the live game. All changes to the canonical board go through here.
class RuleEngine {
public:
  explicit RuleEngine(int startRows = DEFAULT_START_ROWS);

  const Board& board() const { return board_; }
  Side turn() const { return board_.turn(); }

  // Pointer/tap input on cell (x, y). Returns true if anything changed.
  bool handle_input(int x, int y);

  // Plays a move chosen elsewhere (automation). Returns true if the turn passed.
  bool apply(const PlyMove& pm);

  void reset(int rows);
  void reset() { reset(board_.start_rows()); }

  // Replaces the position wholesale (text layouts, tests).
  void load(const Board& b);

  // Bumped on every change; lets async work detect that it went stale.
  std::uint64_t version() const { return version_; }

private:
  bool selectable(int x, int y, bool anyCapture) const;

  Board board_;
  std::uint64_t version_ = 0;
};

} // namespace draughts
