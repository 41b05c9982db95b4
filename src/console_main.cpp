#include "draughts/console.hpp"
#include <iostream>

int main() {
  std::ios::sync_with_stdio(false);
  std::cin.tie(nullptr);
  draughts::console_loop(std::cin, std::cout);
  return 0;
}
