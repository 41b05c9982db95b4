// include/draughts/console.hpp
#pragma once
#include <iosfwd>
#include "draughts/scheduler.hpp"

namespace draughts {

struct ConsoleOptions {
  int startRows = DEFAULT_START_ROWS;
  Difficulty difficulty = Difficulty::Off;
  SchedulerConfig scheduler{};
};

// Line-oriented host for one game: stands in for the renderer/UI. Commands:
//   click <x> <y> | reset [rows] | ai <off|easy|medium|hard> | show
//   moves <x> <y> | layout <text...> | wait [ms] | quit
// Emits "board <layout>", "turn <a|b>", "gameover <a|b>", "error <what>".
void console_loop(std::istream& in, std::ostream& out, const ConsoleOptions& opt);
void console_loop(std::istream& in, std::ostream& out);
void console_loop(); // stdin/stdout

} // namespace draughts
