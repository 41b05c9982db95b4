#include <cassert>
#include <stdexcept>
#include "draughts/board.hpp"
#include "draughts/layout.hpp"


int main() {
using namespace draughts;

// Default board is the 3-row opening
Board a;
assert(to_layout(a) == STARTPOS_LAYOUT);
assert(a.turn() == Side::A);
assert(!a.selection());
assert(a.count_pieces(Side::A) == 12 && a.count_pieces(Side::B) == 12);

// reset(rows) lays men on dark squares only, B on top, A at the bottom
for (int rows = 1; rows <= MAX_START_ROWS; ++rows) {
  Board b;
  b.set(3, 3, Cell::KingA);
  b.select(Coord{3, 3});
  b.set_turn(Side::B);
  b.reset(rows);
  assert(b.turn() == Side::A);
  assert(!b.selection());
  assert(b.start_rows() == rows);
  for (int y = 0; y < BOARD_N; ++y)
    for (int x = 0; x < BOARD_N; ++x) {
      Cell want = Cell::Empty;
      if ((x + y) % 2 == 1 && y < rows) want = Cell::ManB;
      if ((x + y) % 2 == 1 && y >= BOARD_N - rows) want = Cell::ManA;
      assert(b.get(x, y) == want);
    }
  assert(b.count_pieces(Side::A) == 4 * rows);
  // Same count twice gives the same board
  Board c(rows);
  assert(b == c);
}

// Out of range: reads give Empty, writes are ignored
Board b;
assert(b.get(-1, 0) == Cell::Empty);
assert(b.get(0, 8) == Cell::Empty);
assert(b.get(8, 8) == Cell::Empty);
Board before = b;
b.set(8, 0, Cell::KingB);
b.set(0, -1, Cell::KingB);
assert(b == before);

// Clones are independent
Board k = b.clone();
k.set(3, 4, Cell::KingA);
k.set_turn(Side::B);
assert(b.get(3, 4) == Cell::Empty);
assert(b.turn() == Side::A);

// Classifiers
assert(is_side_a(Cell::ManA) && is_side_a(Cell::KingA) && !is_side_a(Cell::ManB));
assert(is_side_b(Cell::ManB) && is_side_b(Cell::KingB) && !is_side_b(Cell::Empty));
assert(is_king(Cell::KingA) && is_king(Cell::KingB) && !is_king(Cell::ManA));

// Row counts that would overlap the armies are refused
bool threw = false;
try { b.reset(4); } catch (const std::invalid_argument&) { threw = true; }
assert(threw);
threw = false;
try { b.reset(0); } catch (const std::invalid_argument&) { threw = true; }
assert(threw);

return 0;
}
