/*
================================================================================
Fragment 3.1 — CLI: Main Entry Point (parcel_sort)
FILE: cpp/cli/main.cpp

Usage:
  parcel_sort <width> <height> <length> <mass>
  parcel_sort --help

Prints STANDARD, SPECIAL or REJECTED on stdout; diagnostics on stderr.
================================================================================
*/

#include <exception>
#include <iostream>

#include "cli/sort_cli.hpp"

int main(int argc, char** argv) {
  try {
    return parcel::cli::run_sort_cli(argc, argv, std::cout, std::cerr);
  } catch (const std::exception& e) {
    std::cerr << "Unexpected Error: " << e.what() << "\n";
    return static_cast<int>(parcel::cli::ExitCode::kError);
  }
}
