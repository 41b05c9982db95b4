#include "draughts/console.hpp"
#include "draughts/board.hpp"
#include "draughts/event_loop.hpp"
#include "draughts/game.hpp"
#include "draughts/layout.hpp"
#include "draughts/movegen.hpp"
#include "draughts/rules.hpp"
#include "draughts/scheduler.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace draughts {

// ------------ tokenization ------------
static std::vector<std::string> split_ws(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static std::string join_from(const std::vector<std::string>& toks, size_t start) {
  std::string s;
  for (size_t i = start; i < toks.size(); ++i) {
    if (!s.empty()) s.push_back(' ');
    s += toks[i];
  }
  return s;
}

static int to_int(const std::string& s) {
  std::size_t used = 0;
  const int v = std::stoi(s, &used);
  if (used != s.size()) throw std::invalid_argument("not a number: " + s);
  return v;
}

static char side_char(Side s) { return s == Side::A ? 'a' : 'b'; }

namespace {

// One game wired the way the graphical front end wires it.
class Session {
public:
  Session(std::ostream& out, const ConsoleOptions& opt)
    : out_(out),
      rules_(opt.startRows),
      sched_(loop_, rules_,
             SchedulerCallbacks{ [this] { print_board(); },
                                 [this] { print_turn(); },
                                 [this] { check_game_over_now(); } },
             opt.scheduler) {
    sched_.set_enabled(opt.difficulty != Difficulty::Off);
    sched_.set_tier(opt.difficulty);
  }

  void start() {
    print_board();
    print_turn();
    sched_.maybe_act_now();
  }

  void click(int x, int y) {
    if (!rules_.handle_input(x, y)) return;
    print_board();
    print_turn();
    check_game_over_now();
    sched_.maybe_act_now();
  }

  void reset(int rows) {
    rules_.reset(rows);
    reset_common();
  }

  void reset() {
    rules_.reset();
    reset_common();
  }

  // Changing difficulty restarts the game, like the settings panel does.
  void set_difficulty(Difficulty d) {
    const bool on = d != Difficulty::Off;
    sched_.set_enabled(on);
    if (on) sched_.set_tier(d);
    rules_.reset();
    over_ = false;
    print_board();
    print_turn();
    sched_.cancel();
    sched_.maybe_act_now();
  }

  void load(const Board& b) {
    sched_.cancel();
    rules_.load(b);
    over_ = false;
    print_board();
    print_turn();
    check_game_over_now();
    sched_.maybe_act_now();
  }

  void show() {
    out_ << to_diagram(rules_.board());
    print_board();
    print_turn();
    out_ << "ai " << (sched_.enabled() ? to_string(sched_.tier()) : std::string("off")) << "\n";
    out_.flush();
  }

  void moves(int x, int y) {
    const Board& b = rules_.board();
    const bool forced = has_any_capture_moves(b, b.turn());
    MoveList ml;
    legal_moves(b, x, y, ml);
    out_ << "moves";
    for (const auto& m : ml) {
      if (forced && !m.capture) continue;
      out_ << ' ' << move_to_text(PlyMove{ Coord{x, y}, m });
    }
    out_ << "\n";
    out_.flush();
  }

  bool wait(std::chrono::milliseconds ms) { return loop_.run_until_idle(ms); }
  void poll() { loop_.poll(); }

private:
  void reset_common() {
    over_ = false;
    print_board();
    print_turn();
    sched_.cancel();
    sched_.maybe_act_now();
  }

  void print_board() {
    out_ << "board " << to_layout(rules_.board()) << "\n";
    out_.flush();
  }

  void print_turn() {
    out_ << "turn " << side_char(rules_.turn()) << "\n";
    out_.flush();
  }

  // Announces the winner once, then starts a new game from the event loop.
  void check_game_over_now() {
    if (over_) return;
    const GameOutcome o = check_game_over(rules_.board());
    if (o == GameOutcome::None) return;
    over_ = true;
    sched_.cancel();
    out_ << "gameover " << to_string(o) << "\n";
    out_.flush();
    loop_.post([this] { reset(); });
  }

  std::ostream& out_;
  EventLoop loop_;
  RuleEngine rules_;
  MoveScheduler sched_;
  bool over_ = false;
};

} // namespace

// ------------ console loop ------------
void console_loop(std::istream& in, std::ostream& out, const ConsoleOptions& opt) {
  Session s(out, opt);
  s.start();

  std::string line;
  while (std::getline(in, line)) {
    auto tokens = split_ws(line);
    if (tokens.empty()) continue;
    const std::string& cmd = tokens[0];

    try {
      if (cmd == "click") {
        if (tokens.size() < 3) throw std::invalid_argument("usage: click <x> <y>");
        s.click(to_int(tokens[1]), to_int(tokens[2]));
      }
      else if (cmd == "reset") {
        if (tokens.size() >= 2) s.reset(to_int(tokens[1]));
        else s.reset();
      }
      else if (cmd == "ai") {
        if (tokens.size() < 2) throw std::invalid_argument("usage: ai <off|easy|medium|hard>");
        s.set_difficulty(parse_difficulty(tokens[1]));
      }
      else if (cmd == "show") {
        s.show();
      }
      else if (cmd == "moves") {
        if (tokens.size() < 3) throw std::invalid_argument("usage: moves <x> <y>");
        s.moves(to_int(tokens[1]), to_int(tokens[2]));
      }
      else if (cmd == "layout") {
        s.load(board_from_layout(join_from(tokens, 1)));
      }
      else if (cmd == "wait") {
        const int ms = tokens.size() >= 2 ? to_int(tokens[1]) : 10000;
        if (!s.wait(std::chrono::milliseconds(ms))) {
          out << "timeout\n";
          out.flush();
        }
      }
      else if (cmd == "quit") {
        break;
      }
      else {
        throw std::invalid_argument("unknown command: " + cmd);
      }
      s.poll();
    } catch (const std::exception& e) {
      out << "error " << e.what() << "\n";
      out.flush();
    }
  }
}

void console_loop(std::istream& in, std::ostream& out) {
  console_loop(in, out, ConsoleOptions{});
}

void console_loop() { console_loop(std::cin, std::cout); }

} // namespace draughts
