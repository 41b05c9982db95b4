#pragma once
#include "draughts/board.hpp"

namespace draughts {

constexpr int VAL_MAN  = 100;
constexpr int VAL_KING = 300;
constexpr int MOBILITY_WEIGHT = 5;

// Material plus mobility, positive = good for `root`.
int evaluate(const Board& b, Side root);

// Material only, positive = good for `root`.
int material(const Board& b, Side root);

} // namespace draughts
