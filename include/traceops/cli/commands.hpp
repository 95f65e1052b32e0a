#pragma once

namespace traceops::cli {

int run_cli(int argc, char **argv);

} // namespace traceops::cli
