#include "Repl.hpp"
#include <iostream>

int main() {
  return run_repl(std::cin, std::cout, std::cerr);
}
