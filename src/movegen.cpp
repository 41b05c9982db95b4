#include "draughts/movegen.hpp"
#include "draughts/types.hpp"
#include "draughts/board.hpp"

namespace draughts {

// Diagonal rays, in generation order.
static constexpr int DX[4] = {-1, +1, -1, +1};
static constexpr int DY[4] = {-1, -1, +1, +1};

static void king_moves(const Board& b, int x, int y, Side us, MoveList& out) {
  for (int dir = 0; dir < 4; ++dir) {
    bool sawEnemy = false;
    Coord enemy{};
    int nx = x + DX[dir], ny = y + DY[dir];
    while (on_board(nx, ny)) {
      const Cell t = b.get(nx, ny);
      if (!sawEnemy) {
        if (t == Cell::Empty) {
          out.push(Move{ Coord{nx, ny}, false, std::nullopt });
        } else if (is_enemy(t, us)) {
          sawEnemy = true;
          enemy = Coord{nx, ny};
        } else {
          break; // own piece
        }
      } else {
        if (t != Cell::Empty) break; // second piece closes the ray
        out.push(Move{ Coord{nx, ny}, true, enemy });
      }
      nx += DX[dir]; ny += DY[dir];
    }
  }
}

static void man_moves(const Board& b, int x, int y, Side us, MoveList& out) {
  const int fwd = forward_dy(us);
  for (int dir = 0; dir < 4; ++dir) {
    const int nx = x + DX[dir], ny = y + DY[dir];
    if (!on_board(nx, ny)) continue;
    const Cell t = b.get(nx, ny);

    if (t == Cell::Empty) {
      if (DY[dir] == fwd) out.push(Move{ Coord{nx, ny}, false, std::nullopt });
      continue;
    }
    if (!is_enemy(t, us)) continue;

    // Captures go in all four directions.
    const int jx = nx + DX[dir], jy = ny + DY[dir];
    if (on_board(jx, jy) && b.get(jx, jy) == Cell::Empty)
      out.push(Move{ Coord{jx, jy}, true, Coord{nx, ny} });
  }
}

void legal_moves(const Board& b, int x, int y, MoveList& out) {
  out.clear();
  const Cell pc = b.get(x, y);
  if (pc == Cell::Empty) return;

  const Side us = is_side_a(pc) ? Side::A : Side::B;
  if (is_king(pc)) king_moves(b, x, y, us, out);
  else             man_moves(b, x, y, us, out);
}

bool has_capture_moves(const Board& b, int x, int y) {
  const Cell pc = b.get(x, y);
  if (pc == Cell::Empty) return false;
  const Side us = is_side_a(pc) ? Side::A : Side::B;

  for (int dir = 0; dir < 4; ++dir) {
    if (is_king(pc)) {
      int nx = x + DX[dir], ny = y + DY[dir];
      bool sawEnemy = false;
      while (on_board(nx, ny)) {
        const Cell t = b.get(nx, ny);
        if (!sawEnemy) {
          if (is_enemy(t, us)) sawEnemy = true;
          else if (t != Cell::Empty) break;
        } else {
          if (t == Cell::Empty) return true;
          break;
        }
        nx += DX[dir]; ny += DY[dir];
      }
    } else {
      const int nx = x + DX[dir], ny = y + DY[dir];
      const int jx = nx + DX[dir], jy = ny + DY[dir];
      if (!on_board(nx, ny) || !on_board(jx, jy)) continue;
      if (is_enemy(b.get(nx, ny), us) && b.get(jx, jy) == Cell::Empty) return true;
    }
  }
  return false;
}

bool has_any_capture_moves(const Board& b, Side side) {
  for (int y = 0; y < BOARD_N; ++y)
    for (int x = 0; x < BOARD_N; ++x)
      if (belongs_to(b.get(x, y), side) && has_capture_moves(b, x, y)) return true;
  return false;
}

bool has_any_moves(const Board& b, Side side) {
  MoveList ml;
  for (int y = 0; y < BOARD_N; ++y)
    for (int x = 0; x < BOARD_N; ++x) {
      if (!belongs_to(b.get(x, y), side)) continue;
      legal_moves(b, x, y, ml);
      if (!ml.empty()) return true;
    }
  return false;
}

static void push_piece_moves(const Board& b, int x, int y, bool capturesOnly,
                             std::vector<PlyMove>& out) {
  MoveList ml;
  legal_moves(b, x, y, ml);
  for (const auto& m : ml) {
    if (capturesOnly && !m.capture) continue;
    out.push_back(PlyMove{ Coord{x, y}, m });
  }
}

void collect_moves(const Board& b, Side side, std::vector<PlyMove>& out) {
  out.clear();
  const bool anyCapture = has_any_capture_moves(b, side);

  // Continuation: only the piece in the middle of a capture chain may move.
  if (b.in_chain()) {
    const Coord s = *b.selection();
    if (belongs_to(b.get(s), side)) {
      push_piece_moves(b, s.x, s.y, anyCapture, out);
      return;
    }
  }

  for (int y = 0; y < BOARD_N; ++y)
    for (int x = 0; x < BOARD_N; ++x)
      if (belongs_to(b.get(x, y), side)) push_piece_moves(b, x, y, anyCapture, out);
}

std::vector<PlyMove> collect_moves(const Board& b, Side side) {
  std::vector<PlyMove> out;
  out.reserve(32);
  collect_moves(b, side, out);
  return out;
}

} // namespace draughts
