#include "chunker/cli/cli.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
  try {
    chunker::cli::CLI cli(std::cout, std::cerr);
    return cli.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << '\n';
    return chunker::cli::EXIT_ERROR;
  }
}
