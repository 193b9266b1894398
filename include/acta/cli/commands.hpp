#pragma once

namespace acta::cli {

void print_help();
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace acta::cli
