#include <cassert>
#include <stdexcept>
#include "draughts/board.hpp"
#include "draughts/layout.hpp"
#include "draughts/game.hpp"

int main() {
  using namespace draughts;

  Board b;
  assert(perft(b, 0) == 1ULL);
  assert(perft(b, 1) == 7ULL);
  assert(perft(b, 2) == 49ULL);

  Board two(2);
  assert(perft(two, 1) == 7ULL);
  assert(perft(two, 2) == 49ULL);

  // Continuation jumps count as plies of the same side
  Board chain = board_from_layout("......../.b....../..a...../......../....b.../......../......../........ a");
  assert(perft(chain, 1) == 1ULL);
  assert(perft(chain, 2) == 3ULL);

  // Negative depth is refused
  bool threw = false;
  try { (void)perft(b, -1); } catch (const std::invalid_argument&) { threw = true; }
  assert(threw);

  // Perft leaves the board alone
  const Board before = b;
  (void)perft(b, 3);
  assert(b == before);

  return 0;
}
