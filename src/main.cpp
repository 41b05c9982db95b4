#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>
#include <exception>
#include <random>
#include <stdexcept>

#include "draughts/types.hpp"
#include "draughts/board.hpp"
#include "draughts/layout.hpp"
#include "draughts/movegen.hpp"
#include "draughts/eval.hpp"
#include "draughts/search.hpp"
#include "draughts/game.hpp"

using namespace draughts;

static void usage() {
  std::cout <<
    "Draughts CLI\n"
    "Usage:\n"
    "  draughts_cli moves <x> <y> [layout...]\n"
    "  draughts_cli eval [layout...]\n"
    "  draughts_cli search <easy|medium|hard> [depth <N>] [seed <N>] [layout <...>]\n"
    "  draughts_cli perft <depth> [layout...]\n"
    "  draughts_cli selfplay [games <N>] [plies <N>] [a <tier>] [b <tier>]\n"
    "                        [rows <N>] [seed <N>]\n"
    "If layout omitted, uses the 3-row start position.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static Board board_from_args(const std::vector<std::string>& a, size_t layoutStart) {
  if (layoutStart < a.size()) return board_from_layout(join_from(a, layoutStart));
  return board_from_layout(STARTPOS_LAYOUT);
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

static std::uint64_t to_u64(const std::string& s) {
  return static_cast<std::uint64_t>(std::stoull(s));
}

static const char* side_name(Side s) { return s == Side::A ? "a" : "b"; }

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  // moves <x> <y> [layout...]
  if (cmd == "moves") {
    if (args.size() < 3) { usage(); return 1; }
    const int x = to_int(args[1]), y = to_int(args[2]);
    Board b = board_from_args(args, 3);
    MoveList ml;
    legal_moves(b, x, y, ml);
    for (const auto& m : ml) std::cout << move_to_text(PlyMove{ Coord{x, y}, m }) << "\n";
    std::cout << "total " << ml.size()
              << (has_capture_moves(b, x, y) ? " (captures available)" : "") << "\n";
    return 0;
  }

  // eval [layout...]
  if (cmd == "eval") {
    Board b = board_from_args(args, 1);
    const Side stm = b.turn();
    std::cout << "eval " << evaluate(b, stm)
              << " material " << material(b, stm)
              << " (" << side_name(stm) << " to move)\n";
    return 0;
  }

  // search <tier> [depth <N>] [seed <N>] [layout <...>]
  if (cmd == "search") {
    if (args.size() < 2) { usage(); return 1; }
    SearchConfig cfg = config_for(parse_difficulty(args[1]));
    std::uint64_t seed = std::random_device{}();
    size_t layoutStart = args.size();

    for (size_t i = 2; i < args.size(); ++i) {
      const std::string& tok = args[i];
      if (tok == "layout") { layoutStart = i + 1; break; }
      if (i + 1 >= args.size()) break;
      const std::string& val = args[i + 1];
      if (tok == "depth") { cfg.tier = Tier::AlphaBeta; cfg.depth = to_int(val); ++i; continue; }
      if (tok == "seed")  { seed = to_u64(val); ++i; continue; }
    }

    Board b = board_from_args(args, layoutStart);
    std::mt19937_64 rng(seed);
    auto r = choose_move(b, b.turn(), cfg, rng);
    if (!r) {
      std::cout << "best none (" << side_name(b.turn()) << " has no move)\n";
      return 0;
    }
    std::cout << "best " << move_to_text(r->best)
              << " score " << r->score
              << " nodes " << r->nodes
              << " candidates " << r->candidates << "\n";
    return 0;
  }

  // perft <depth> [layout...]
  if (cmd == "perft") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    if (depth < 0) throw std::invalid_argument("perft depth must be >= 0");
    Board b = board_from_args(args, 2);
    std::cout << perft(b, depth) << "\n";
    return 0;
  }

  // selfplay [games <N>] [plies <N>] [a <tier>] [b <tier>] [rows <N>] [seed <N>]
  if (cmd == "selfplay") {
    int games = 1, plies = 200, rows = DEFAULT_START_ROWS;
    SearchConfig a = config_for(Difficulty::Medium);
    SearchConfig bcfg = config_for(Difficulty::Easy);
    std::uint64_t seed = 1;

    for (size_t i = 1; i + 1 < args.size(); i += 2) {
      const std::string& tok = args[i];
      const std::string& val = args[i + 1];
      if      (tok == "games") games = to_int(val);
      else if (tok == "plies") plies = to_int(val);
      else if (tok == "a")     a = config_for(parse_difficulty(val));
      else if (tok == "b")     bcfg = config_for(parse_difficulty(val));
      else if (tok == "rows")  rows = to_int(val);
      else if (tok == "seed")  seed = to_u64(val);
    }

    int winsA = 0, winsB = 0, open = 0;
    const Board start(rows);
    for (int g = 0; g < games; ++g) {
      GameReport rep = selfplay(start, a, bcfg, plies, seed + static_cast<std::uint64_t>(g));
      std::cout << "game " << (g + 1) << " result " << to_string(rep.outcome)
                << " plies " << rep.plies << " (" << rep.reason << ")\n";
      switch (rep.outcome) {
        case GameOutcome::SideAWins: ++winsA; break;
        case GameOutcome::SideBWins: ++winsB; break;
        case GameOutcome::None:      ++open;  break;
      }
    }
    std::cout << "summary a " << winsA << " b " << winsB << " unfinished " << open << "\n";
    return 0;
  }

  usage();
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << "error " << e.what() << "\n";
    return 1;
  }
}
