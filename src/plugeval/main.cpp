#include "plugeval/cli/router.hpp"

int main(int argc, char** argv) {
  // Keep the process entrypoint thin. All command parsing and output/exit-code
  // contracts live in the CLI router.
  return plugeval::cli::Dispatch(argc, argv);
}
