#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "draughts/board.hpp"
#include "draughts/move.hpp"

namespace draughts {

struct LayoutError : std::runtime_error { using std::runtime_error::runtime_error; };

// Layout text: 8 ranks top (y = 0) to bottom separated by '/', each 8 cells of
// '.', 'a', 'A', 'b', 'B'; then the side to move ('a' or 'b'); then optionally
// the selected square "x,y", with a trailing '!' when it is a capture chain.
inline constexpr char STARTPOS_LAYOUT[] =
  ".b.b.b.b/b.b.b.b./.b.b.b.b/......../......../a.a.a.a./.a.a.a.a/a.a.a.a. a";

void set_from_layout(Board& b, std::string_view text);
Board board_from_layout(std::string_view text);
std::string to_layout(const Board& b);

// Multi-line diagram for terminals, row 0 first.
std::string to_diagram(const Board& b);

// "x,y" <-> Coord. Throws LayoutError on malformed or off-board input.
Coord parse_coord(std::string_view s);
std::string coord_to_text(Coord c);

// "x,y-x,y" or "x,y:x,y" for captures.
std::string move_to_text(const PlyMove& m);

} // namespace draughts
