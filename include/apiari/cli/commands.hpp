#pragma once

namespace apiari::cli {

int run_cli(int argc, char **argv);

} // namespace apiari::cli
