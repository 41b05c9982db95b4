#include <cassert>
#include "draughts/board.hpp"
#include "draughts/layout.hpp"
#include "draughts/eval.hpp"

int main() {
  using namespace draughts;

  // Opening is balanced
  Board b;
  assert(material(b, Side::A) == 0);
  assert(evaluate(b, Side::A) == 0);
  assert(evaluate(b, Side::B) == 0);

  // Equal material, A has one more move than B
  Board m = board_from_layout(".......b/......../......../......../......../..a...../......../........ a");
  assert(material(m, Side::A) == 0);
  assert(evaluate(m, Side::A) == MOBILITY_WEIGHT);
  assert(evaluate(m, Side::B) == -MOBILITY_WEIGHT);

  // A king is worth three men and slides the whole diagonal
  Board k = board_from_layout(".......b/......../......../......../......../......../......../A....... a");
  assert(material(k, Side::A) == VAL_KING - VAL_MAN);
  assert(evaluate(k, Side::A) == 225);
  assert(evaluate(k, Side::B) == -225);

  // Evaluation does not depend on whose turn it is
  Board k2 = k;
  k2.set_turn(Side::B);
  assert(evaluate(k2, Side::A) == evaluate(k, Side::A));

  return 0;
}
