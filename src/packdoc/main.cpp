#include "packdoc/cli/router.hpp"

int main(int argc, char** argv) {
  // Argument parsing, output and exit codes all live in the router.
  return packdoc::cli::Dispatch(argc, argv);
}
