#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include "draughts/types.hpp"


namespace draughts {


class Board {
public:
  Board();
  explicit Board(int startRows);

  // Empties every cell, turn to A, no selection. Start-row setting is kept.
  void clear();

  // Standard opening layout with `rows` ranks of men per side on dark squares.
  // Throws std::invalid_argument if rows is outside 1..MAX_START_ROWS.
  void reset(int rows);
  void reset() { reset(start_rows_); }

  // Out-of-range reads return Cell::Empty, out-of-range writes are ignored.
  Cell get(int x, int y) const;
  Cell get(Coord c) const { return get(c.x, c.y); }
  void set(int x, int y, Cell kind);
  void set(Coord c, Cell kind) { set(c.x, c.y, kind); }

  Board clone() const { return *this; }

  Side turn() const { return turn_; }
  void set_turn(Side s) { turn_ = s; }

  // Selection is either a piece picked by input or, with chain set, the piece
  // that just captured and must keep capturing.
  const std::optional<Coord>& selection() const { return selection_; }
  bool in_chain() const { return selection_.has_value() && chain_; }
  void select(Coord c, bool chain = false) { selection_ = c; chain_ = chain; }
  void clear_selection() { selection_.reset(); chain_ = false; }

  int start_rows() const { return start_rows_; }

  int count_pieces(Side s) const;

  bool operator==(const Board& o) const;
  bool operator!=(const Board& o) const { return !(*this == o); }


private:
  // cells_[y][x]
  std::array<std::array<Cell, BOARD_N>, BOARD_N> cells_{};
  Side turn_ = Side::A;
  std::optional<Coord> selection_{};
  bool chain_ = false;
  int start_rows_ = DEFAULT_START_ROWS;
};


} // namespace draughts
