#pragma once

namespace gembridge::cli {

void print_help();
int run_cli(int argc, char **argv);

} // namespace gembridge::cli
