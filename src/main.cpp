#include "apiari/cli/commands.hpp"

int main(int argc, char **argv) { return apiari::cli::run_cli(argc, argv); }
