#pragma once
/*
================================================================================
Fragment 3.0 — CLI: parcel_sort Runner
FILE: cpp/cli/sort_cli.hpp

Usage:
  parcel_sort [--log-level debug|info|warn|error] <width> <height> <length> <mass>

Exit codes:
  0 => category printed (or usage requested)
  1 => invalid arguments, unparseable number or validation failure

Notes:
  - main() forwards to run_sort_cli() with std::cout/std::cerr; the selftest
    passes string streams instead.
  - Debug traces go through engine/core/logging, not through out/err.
================================================================================
*/

#include <iosfwd>

namespace parcel::cli {

enum class ExitCode : int {
  kSuccess = 0,
  kError = 1,
};

void print_usage(std::ostream& os);

int run_sort_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

}  // namespace parcel::cli
