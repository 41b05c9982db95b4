#include "draughts/layout.hpp"
#include "draughts/movegen.hpp"
#include <cctype>
#include <sstream>
#include <string>

namespace draughts {

static inline Cell char_to_cell(char c, bool& ok) {
  ok = true;
  switch (c) {
    case '.': return Cell::Empty;
    case 'a': return Cell::ManA;
    case 'A': return Cell::KingA;
    case 'b': return Cell::ManB;
    case 'B': return Cell::KingB;
    default:  ok = false; return Cell::Empty;
  }
}

static inline char cell_to_char(Cell c) {
  switch (c) {
    case Cell::ManA:  return 'a';
    case Cell::KingA: return 'A';
    case Cell::ManB:  return 'b';
    case Cell::KingB: return 'B';
    default:          return '.';
  }
}

static int parse_small_int(std::string_view s) {
  if (s.empty() || s.size() > 2) throw LayoutError("Bad coordinate number");
  int v = 0;
  for (char ch : s) {
    if (!std::isdigit(static_cast<unsigned char>(ch))) throw LayoutError("Bad coordinate number");
    v = v * 10 + (ch - '0');
  }
  return v;
}

Coord parse_coord(std::string_view s) {
  const auto comma = s.find(',');
  if (comma == std::string_view::npos) throw LayoutError("Coordinate must look like x,y");
  const int x = parse_small_int(s.substr(0, comma));
  const int y = parse_small_int(s.substr(comma + 1));
  if (!on_board(x, y)) throw LayoutError("Coordinate off the board");
  return Coord{x, y};
}

std::string coord_to_text(Coord c) {
  return std::to_string(c.x) + "," + std::to_string(c.y);
}

std::string move_to_text(const PlyMove& m) {
  return coord_to_text(m.from) + (m.move.capture ? ":" : "-") + coord_to_text(m.move.to);
}

void set_from_layout(Board& b, std::string_view text) {
  b.clear();

  std::string str(text);
  std::istringstream ss(str);
  std::string placement, turn, sel, extra;
  if (!(ss >> placement >> turn))
    throw LayoutError("Malformed layout: expected placement and side to move");
  ss >> sel;
  if (ss >> extra) throw LayoutError("Malformed layout: trailing fields");

  // 1) Placement
  int y = 0, x = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (x != BOARD_N) throw LayoutError("Layout rank must have 8 cells");
      ++y; x = 0;
      continue;
    }
    bool ok = false;
    const Cell c = char_to_cell(ch, ok);
    if (!ok) throw LayoutError("Invalid cell character in layout");
    if (!on_board(x, y)) throw LayoutError("Square out of range while parsing layout");
    b.set(x, y, c);
    ++x;
  }
  if (y != BOARD_N - 1 || x != BOARD_N) throw LayoutError("Layout must have 8 ranks of 8 cells");

  // 2) Side to move
  if (turn == "a") b.set_turn(Side::A);
  else if (turn == "b") b.set_turn(Side::B);
  else throw LayoutError("Invalid side to move in layout");

  // 3) Selection
  if (!sel.empty()) {
    const bool chain = sel.back() == '!';
    if (chain) sel.pop_back();
    const Coord c = parse_coord(sel);
    if (!belongs_to(b.get(c), b.turn()))
      throw LayoutError("Selected square must hold a piece of the side to move");
    if (chain && !has_capture_moves(b, c.x, c.y))
      throw LayoutError("Capture chain marked on a piece with no capture");
    b.select(c, chain);
  }
}

Board board_from_layout(std::string_view text) {
  Board b;
  set_from_layout(b, text);
  return b;
}

std::string to_layout(const Board& b) {
  std::string out;
  for (int y = 0; y < BOARD_N; ++y) {
    for (int x = 0; x < BOARD_N; ++x) out += cell_to_char(b.get(x, y));
    if (y != BOARD_N - 1) out += '/';
  }
  out += ' ';
  out += (b.turn() == Side::A ? 'a' : 'b');

  if (b.selection()) {
    out += ' ';
    out += coord_to_text(*b.selection());
    if (b.in_chain()) out += '!';
  }
  return out;
}

std::string to_diagram(const Board& b) {
  std::ostringstream oss;
  oss << "  01234567\n";
  for (int y = 0; y < BOARD_N; ++y) {
    oss << y << ' ';
    for (int x = 0; x < BOARD_N; ++x) oss << cell_to_char(b.get(x, y));
    oss << '\n';
  }
  return oss.str();
}

} // namespace draughts
