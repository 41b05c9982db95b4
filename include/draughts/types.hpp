#pragma once
#include <cstdint>


namespace draughts {


constexpr int BOARD_N = 8;
constexpr int DEFAULT_START_ROWS = 3;
constexpr int MAX_START_ROWS = 3; // more would overlap the two armies on 8x8


enum class Side : int { A = 0, B = 1 };


// Cell contents. Side A starts at the bottom (high y) and moves toward y = 0.
enum class Cell : std::uint8_t { Empty = 0, ManA = 1, ManB = 2, KingA = 3, KingB = 4 };


struct Coord {
  int x = 0;
  int y = 0;
};

inline constexpr bool operator==(Coord a, Coord b) { return a.x == b.x && a.y == b.y; }
inline constexpr bool operator!=(Coord a, Coord b) { return !(a == b); }


inline constexpr bool on_board(int x, int y) {
  return x >= 0 && x < BOARD_N && y >= 0 && y < BOARD_N;
}

inline constexpr bool is_side_a(Cell c) { return c == Cell::ManA || c == Cell::KingA; }
inline constexpr bool is_side_b(Cell c) { return c == Cell::ManB || c == Cell::KingB; }
inline constexpr bool is_king(Cell c)   { return c == Cell::KingA || c == Cell::KingB; }

inline constexpr bool belongs_to(Cell c, Side s) {
  return s == Side::A ? is_side_a(c) : is_side_b(c);
}

inline constexpr bool is_enemy(Cell c, Side us) {
  return us == Side::A ? is_side_b(c) : is_side_a(c);
}

inline constexpr Side other(Side s) { return s == Side::A ? Side::B : Side::A; }

// Row delta of a man's simple move.
inline constexpr int forward_dy(Side s) { return s == Side::A ? -1 : +1; }

// Row on which a man of side s is crowned.
inline constexpr int promotion_row(Side s) { return s == Side::A ? 0 : BOARD_N - 1; }

inline constexpr Cell man_of(Side s)  { return s == Side::A ? Cell::ManA : Cell::ManB; }
inline constexpr Cell king_of(Side s) { return s == Side::A ? Cell::KingA : Cell::KingB; }


} // namespace draughts
