#pragma once
#include <vector>
#include "draughts/board.hpp"
#include "draughts/movelist.hpp"


namespace draughts {


// Every move of the piece on (x, y), captures and simple moves interleaved
// in ray order. Forced capture is NOT applied here. Empty square -> no moves.
void legal_moves(const Board& b, int x, int y, MoveList& out);

// True if the piece on (x, y) has at least one capture.
bool has_capture_moves(const Board& b, int x, int y);

// True if any piece of `side` has a capture.
bool has_any_capture_moves(const Board& b, Side side);

// True if any piece of `side` has any move at all (forced capture aside).
bool has_any_moves(const Board& b, Side side);

// Candidate moves for `side` with forced capture and continuation applied:
// if the board selection holds a piece of `side`, only that piece is used.
// Squares are visited row by row, top to bottom.
void collect_moves(const Board& b, Side side, std::vector<PlyMove>& out);
std::vector<PlyMove> collect_moves(const Board& b, Side side);


} // namespace draughts
