#include <cassert>
#include <chrono>
#include <sstream>
#include <string>
#include "draughts/console.hpp"
#include "draughts/layout.hpp"

using namespace draughts;
using namespace std::chrono_literals;

static std::string run(const std::string& script, ConsoleOptions opt = {}) {
  std::istringstream in(script);
  std::ostringstream out;
  console_loop(in, out, opt);
  return out.str();
}

static bool has(const std::string& out, const std::string& line) {
  return out.find(line) != std::string::npos;
}

static std::string last_turn(const std::string& out) {
  const auto at = out.rfind("turn ");
  return out.substr(at, 6);
}

int main() {
  const std::string start = std::string("board ") + STARTPOS_LAYOUT + "\n";

  // Human against human
  {
    const std::string out = run("click 2 5\nclick 1 4\nshow\nfoo\nclick 3\n");
    assert(out.rfind(start + "turn a\n", 0) == 0);
    assert(has(out, std::string("board ") + STARTPOS_LAYOUT + " 2,5\n"));
    assert(has(out, "turn b\n"));
    assert(has(out, "ai off\n"));
    assert(has(out, "error unknown command: foo\n"));
    assert(has(out, "error usage: click <x> <y>\n"));
  }

  // Moves listing honours forced capture
  {
    const std::string out = run(
      "layout .......b/......../......../......../.b....../..a...a./......../........ a\n"
      "moves 2 5\nmoves 6 5\n");
    assert(has(out, "moves 2,5:0,3\n"));
    assert(has(out, "moves\n"));
  }

  // The automated side answers
  {
    ConsoleOptions opt;
    opt.scheduler.first_delay = 0ms;
    opt.scheduler.followup_delay = 0ms;
    opt.scheduler.seed = 1;
    const std::string out = run("ai easy\nclick 2 5\nclick 1 4\nwait 2000\n", opt);
    assert(!has(out, "error"));
    assert(!has(out, "timeout"));
    assert(last_turn(out) == "turn a");
  }

  // Game over is announced once and a new game follows
  {
    const std::string out = run(
      "layout ......../......../......../......../......../..a...../......../........ a\n");
    assert(has(out, "gameover a\n"));
    assert(out.find("gameover") == out.rfind("gameover"));
    assert(has(out.substr(out.find("gameover")), start));
  }

  // Bad input and a wait that runs out
  {
    ConsoleOptions opt;
    opt.difficulty = Difficulty::Easy;
    opt.scheduler.first_delay = 10000ms;
    opt.scheduler.seed = 1;
    const std::string out = run(
      "layout nonsense\nai expert\nclick a b\n"
      "layout ......../......../.b....../......../......../......a./......../........ b\n"
      "wait 20\nquit\nclick 2 5\n", opt);
    assert(has(out, "error Malformed layout"));
    assert(has(out, "error unknown difficulty: expert\n"));
    assert(has(out, "timeout\n"));
    assert(!has(out, "board .b.b.b.b/b.b.b.b./.b.b.b.b/......../......../a.a.a.a./.a.a.a.a/a.a.a.a. a 2,5"));
  }

  return 0;
}
