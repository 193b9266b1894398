#include "acta/cli/commands.hpp"

int main(int argc, char **argv) { return acta::cli::run_cli(argc, argv); }
