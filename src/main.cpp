#include "traceops/cli/commands.hpp"

int main(int argc, char **argv) { return traceops::cli::run_cli(argc, argv); }
