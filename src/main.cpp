#include "gembridge/cli/commands.hpp"

#include <csignal>

int main(int argc, char **argv) {
  // A client that hangs up must surface as a write error, not kill the server.
  std::signal(SIGPIPE, SIG_IGN);
  return gembridge::cli::run_cli(argc, argv);
}
