/*
  CLI Selftest (parcel_sort)

  Drives run_sort_cli() in-process with string streams and checks:
    - exit codes (0 success/help, 1 everything else)
    - which stream carries the category, usage and diagnostics
    - argument-count, parse and validation error texts
    - --log-level debug trace lands on the error stream

  Non-zero return code indicates failure.
*/

#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "cli/sort_cli.hpp"
#include "engine/core/logging.hpp"

namespace parcel {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(std::string(needle)) != std::string::npos;
}

struct RunOut {
  int code = -1;
  std::string out;
  std::string err;
};

RunOut run(std::initializer_list<const char*> args) {
  std::vector<const char*> argv;
  argv.push_back("parcel_sort");
  for (const char* a : args) argv.push_back(a);

  std::ostringstream out;
  std::ostringstream err;
  RunOut r;
  r.code = cli::run_sort_cli(static_cast<int>(argv.size()), argv.data(), out, err);
  r.out = out.str();
  r.err = err.str();
  return r;
}

void test_success_paths() {
  RunOut r = run({"50", "50", "50", "10"});
  expect_true(r.code == 0 && r.out == "STANDARD\n" && r.err.empty(), "50 50 50 10 -> STANDARD on stdout");

  r = run({"150", "50", "50", "10"});
  expect_true(r.code == 0 && r.out == "SPECIAL\n", "150 50 50 10 -> SPECIAL");

  r = run({"150", "150", "150", "25"});
  expect_true(r.code == 0 && r.out == "REJECTED\n", "150 150 150 25 -> REJECTED");

  r = run({"99.99", "100", "100", "1"});
  expect_true(r.code == 0 && r.out == "STANDARD\n", "decimal arguments parse");
}

void test_help_and_usage() {
  RunOut r = run({});
  expect_true(r.code == 0 && contains(r.out, "Usage: parcel_sort"), "no args -> usage on stdout, exit 0");

  r = run({"--help"});
  expect_true(r.code == 0 && contains(r.out, "Usage: parcel_sort") && r.err.empty(), "--help -> usage, exit 0");

  r = run({"1", "2", "-h"});
  expect_true(r.code == 0 && contains(r.out, "Usage: parcel_sort"), "-h anywhere wins over count check");
}

void test_argument_count() {
  RunOut r = run({"1", "2", "3"});
  expect_true(r.code == 1, "3 args -> exit 1");
  expect_true(contains(r.err, "Error: Expected 4 arguments (width, height, length, mass)"), "count error text");
  expect_true(contains(r.err, "Received: 3 argument(s)"), "received count reported");
  expect_true(contains(r.err, "Usage: parcel_sort") && r.out.empty(), "usage follows on stderr");

  r = run({"1", "2", "3", "4", "5"});
  expect_true(r.code == 1 && contains(r.err, "Received: 5 argument(s)"), "5 args -> exit 1");
}

void test_parse_errors() {
  RunOut r = run({"abc", "50", "50", "10"});
  expect_true(r.code == 1 && contains(r.err, "Error: Invalid width \"abc\" - must be a number"),
              "unparseable width");

  r = run({"50", "50", "12cm", "10"});
  expect_true(r.code == 1 && contains(r.err, "Error: Invalid length \"12cm\" - must be a number"),
              "trailing junk rejected");

  r = run({"50", "50", "50", ""});
  expect_true(r.code == 1 && contains(r.err, "Error: Invalid mass \"\" - must be a number"),
              "empty mass rejected");
}

void test_validation_errors() {
  RunOut r = run({"-10", "50", "50", "10"});
  expect_true(r.code == 1 && contains(r.err, "Validation Error: width must be positive, received -10"),
              "negative width is a value, reported by validator");
  expect_true(r.out.empty(), "nothing on stdout for validation failure");

  r = run({"50", "0", "50", "10"});
  expect_true(r.code == 1 && contains(r.err, "Validation Error: height must be positive, received 0"),
              "zero height");

  r = run({"50", "50", "inf", "10"});
  expect_true(r.code == 1 && contains(r.err, "Validation Error: length must be a finite number, received Infinity"),
              "inf length reaches validator");

  r = run({"50", "50", "50", "1e300"});
  expect_true(r.code == 1 && contains(r.err, "Validation Error: mass exceeds maximum safe value"),
              "huge mass");
}

void test_options() {
  RunOut r = run({"--verbose", "1", "1", "1", "1"});
  expect_true(r.code == 1 && contains(r.err, "Argument error: Unknown argument: --verbose"),
              "unknown option rejected");

  r = run({"--log-level"});
  expect_true(r.code == 1 && contains(r.err, "--log-level requires a value"), "--log-level without value");

  r = run({"--log-level", "loud", "1", "1", "1", "1"});
  expect_true(r.code == 1 && contains(r.err, "--log-level must be one of"), "--log-level bad value");

  r = run({"--log-level", "warn", "1", "1", "1", "20"});
  expect_true(r.code == 0 && r.out == "SPECIAL\n", "--log-level consumes its value");
  expect_true(get_log_level() == LogLevel::WARN, "--log-level applied");

  set_log_level(LogLevel::INFO);
}

void test_debug_trace() {
  RunOut r = run({"--log-level", "debug", "150", "1", "1", "20"});
  expect_true(r.code == 0 && r.out == "REJECTED\n", "debug trace leaves stdout as the bare category");
  expect_true(contains(r.err, "][DEBUG] classify width=150 height=1 length=1 mass=20"),
              "debug trace on stderr names the inputs");
  expect_true(contains(r.err, "volume_cm3=150 bulky=1 heavy=1 -> REJECTED"), "debug trace shows derivation");

  r = run({"--log-level", "debug", "50", "-0.000001", "1", "1"});
  expect_true(r.code == 1 && r.out.empty(), "debug trace with validation failure: nothing on stdout");
  expect_true(contains(r.err, "-> NotPositive (height)"), "debug trace names failing field");
  expect_true(contains(r.err, "Validation Error: height must be positive, received -0.000001"),
              "validation message follows trace");

  r = run({"--log-level", "info", "150", "1", "1", "20"});
  expect_true(r.code == 0 && r.err.empty(), "no trace at info level");

  set_log_level(LogLevel::INFO);
}

}  // namespace
}  // namespace parcel

int main() {
  using namespace parcel;

  test_success_paths();
  test_help_and_usage();
  test_argument_count();
  test_parse_errors();
  test_validation_errors();
  test_options();
  test_debug_trace();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
