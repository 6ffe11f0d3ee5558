#include "cli/args.hpp"

#include <iostream>

int main(int argc, char **argv) {
  return normhash::cli::run(argc, argv, std::cout, std::cerr);
}
