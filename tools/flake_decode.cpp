#include <iostream>

#include "flakelib/cli/commands.hpp"

int main(int argc, char** argv) {
  return flakelib::cli::run_flake_decode(argc, argv, std::cout, std::cerr);
}
