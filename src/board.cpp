#include "draughts/board.hpp"
#include <stdexcept>
#include <string>


namespace draughts {


Board::Board() { reset(start_rows_); }


Board::Board(int startRows) { reset(startRows); }


void Board::clear() {
  for (auto& row : cells_) for (auto& c : row) c = Cell::Empty;
  turn_ = Side::A;
  clear_selection();
}


void Board::reset(int rows) {
  if (rows < 1 || rows > MAX_START_ROWS)
    throw std::invalid_argument("start rows must be in 1.." + std::to_string(MAX_START_ROWS));

  start_rows_ = rows;
  clear();

  // Side B on top, side A at the bottom; dark squares have odd x+y.
  for (int y = 0; y < rows; ++y)
    for (int x = 0; x < BOARD_N; ++x)
      if ((x + y) % 2 == 1) cells_[y][x] = Cell::ManB;

  for (int y = BOARD_N - rows; y < BOARD_N; ++y)
    for (int x = 0; x < BOARD_N; ++x)
      if ((x + y) % 2 == 1) cells_[y][x] = Cell::ManA;
}


Cell Board::get(int x, int y) const {
  if (!on_board(x, y)) return Cell::Empty;
  return cells_[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)];
}


void Board::set(int x, int y, Cell kind) {
  if (!on_board(x, y)) return;
  cells_[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)] = kind;
}


int Board::count_pieces(Side s) const {
  int n = 0;
  for (const auto& row : cells_)
    for (Cell c : row)
      if (belongs_to(c, s)) ++n;
  return n;
}


bool Board::operator==(const Board& o) const {
  return cells_ == o.cells_ && turn_ == o.turn_ &&
         selection_ == o.selection_ && in_chain() == o.in_chain();
}


} // namespace draughts
