#include <iostream>

#include <lpakx/cli.hpp>

int main(int argc, char *argv[]) {
  return lpakx::cli::execute(argc, argv, std::cout, std::cerr);
}
