#pragma once
#include <optional>
#include "draughts/types.hpp"


namespace draughts {


// A destination for one piece. `captured` is set iff `capture` is.
struct Move {
  Coord to{};
  bool capture = false;
  std::optional<Coord> captured{};
};


// Move together with the square it starts from.
struct PlyMove {
  Coord from{};
  Move move{};
};


inline bool same_move(const PlyMove& a, const PlyMove& b) {
  return a.from == b.from && a.move.to == b.move.to && a.move.capture == b.move.capture;
}


} // namespace draughts
