#include "draughts/rules.hpp"
#include "draughts/movegen.hpp"
#include "draughts/movelist.hpp"

namespace draughts {

bool apply_move(Board& b, int sx, int sy, int tx, int ty, const Move& m) {
  Cell piece = b.get(sx, sy);
  if (piece == Cell::Empty)
    throw RuleError("apply_move: no piece on the source square");
  if (m.capture && !m.captured)
    throw RuleError("apply_move: capture without captured square");

  b.set(sx, sy, Cell::Empty);
  if (m.capture) b.set(*m.captured, Cell::Empty);

  // Crowning on the far rank
  if (piece == Cell::ManA && ty == promotion_row(Side::A)) piece = Cell::KingA;
  else if (piece == Cell::ManB && ty == promotion_row(Side::B)) piece = Cell::KingB;

  b.set(tx, ty, piece);

  if (m.capture && has_capture_moves(b, tx, ty)) {
    b.select(Coord{tx, ty}, /*chain=*/true);
    return false;
  }

  b.clear_selection();
  b.set_turn(other(b.turn()));
  return true;
}

RuleEngine::RuleEngine(int startRows) : board_(startRows) {}

bool RuleEngine::selectable(int x, int y, bool anyCapture) const {
  if (!belongs_to(board_.get(x, y), board_.turn())) return false;
  return !anyCapture || has_capture_moves(board_, x, y);
}

bool RuleEngine::handle_input(int x, int y) {
  if (!on_board(x, y)) return false;

  const Side us = board_.turn();
  const bool anyCapture = has_any_capture_moves(board_, us);
  const Coord clicked{x, y};

  if (!board_.selection()) {
    if (!selectable(x, y, anyCapture)) return false;
    board_.select(clicked);
    ++version_;
    return true;
  }

  const Coord sel = *board_.selection();
  MoveList ml;
  legal_moves(board_, sel.x, sel.y, ml);
  for (const auto& m : ml) {
    if (anyCapture && !m.capture) continue;
    if (m.to != clicked) continue;
    apply_move(board_, sel.x, sel.y, x, y, m);
    ++version_;
    return true;
  }

  if (belongs_to(board_.get(x, y), us)) {
    // Forced capture elsewhere: this piece may not be picked.
    if (!selectable(x, y, anyCapture)) return false;
    board_.select(clicked, board_.in_chain() && clicked == sel);
    ++version_;
    return true;
  }

  board_.clear_selection();
  ++version_;
  return true;
}

bool RuleEngine::apply(const PlyMove& pm) {
  const bool switched = apply_move(board_, pm);
  ++version_;
  return switched;
}

void RuleEngine::reset(int rows) {
  board_.reset(rows);
  ++version_;
}

void RuleEngine::load(const Board& b) {
  board_ = b;
  ++version_;
}

} // namespace draughts
