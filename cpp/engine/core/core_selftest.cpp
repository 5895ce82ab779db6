/*
  Core Selftest (error codes, logging levels, number formatting)

  Framework-free: prints [ OK ]/[FAIL] to stderr, non-zero exit on failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/number_format.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(std::string(needle)) != std::string::npos;
}

void test_error_codes() {
  expect_eq_str(to_string(ErrorCode::kTypeMismatch), "TypeMismatch", "ErrorCode name: TypeMismatch");
  expect_eq_str(to_string(ErrorCode::kNotFinite), "NotFinite", "ErrorCode name: NotFinite");
  expect_eq_str(to_string(ErrorCode::kNotPositive), "NotPositive", "ErrorCode name: NotPositive");
  expect_eq_str(to_string(ErrorCode::kTooLarge), "TooLarge", "ErrorCode name: TooLarge");
  expect_eq_str(to_string(ErrorCode::kInternal), "Internal", "ErrorCode name: Internal");
  expect_true(static_cast<int>(ErrorCode::kTooLarge) == 4, "ErrorCode values are stable");
  expect_true(static_cast<int>(ErrorCode::kInternal) == 5, "Internal follows the validator codes");
}

void test_error_throw_site() {
  try {
    PARCEL_THROW(ErrorCode::kNotPositive, "width must be positive, received -1");
    fail("PARCEL_THROW must throw");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kNotPositive, "Error carries its code");
    expect_eq_str(e.message(), "width must be positive, received -1", "Error::message is the bare text");

    const std::string what = e.what();
    expect_true(contains(what, "[parcel::Error code=NotPositive(3)]"), "what() has code prefix");
    expect_true(contains(what, "core_selftest.cpp"), "what() has throw site file");
    expect_true(e.line() > 0, "Error records line");
  }
}

void test_log_levels() {
  const LogLevel saved = get_log_level();

  set_log_level(LogLevel::WARN);
  expect_true(get_log_level() == LogLevel::WARN, "set/get log level");
  expect_true(!log_enabled(LogLevel::INFO), "INFO filtered at WARN");
  expect_true(log_enabled(LogLevel::ERROR), "ERROR passes at WARN");

  // Filtered call must be a silent no-op.
  log(LogLevel::DEBUG, "this line must not appear");

  expect_true(parse_log_level("debug") == LogLevel::DEBUG, "parse_log_level debug");
  expect_true(parse_log_level("error") == LogLevel::ERROR, "parse_log_level error");
  expect_true(!parse_log_level("DEBUG").has_value(), "parse_log_level is lowercase only");
  expect_true(!parse_log_level("").has_value(), "parse_log_level rejects empty");
  expect_eq_str(to_string(LogLevel::WARN), "WARN", "LogLevel name");

  const std::string line = format_log_line(LogLevel::DEBUG, "classify width=1");
  expect_true(line.size() > 2 && line[0] == '[' && line.back() == '\n', "log line framed and newline-terminated");
  expect_true(contains(line, "Z][DEBUG] classify width=1\n"), "log line carries UTC stamp, level, message");

  set_log_level(saved);
}

void test_number_format() {
  expect_eq_str(format_number(-10.0), "-10", "format: integer value has no decimals");
  expect_eq_str(format_number(149.99), "149.99", "format: short decimal");
  expect_eq_str(format_number(0.1), "0.1", "format: 0.1");
  expect_eq_str(format_number(0.0), "0", "format: zero");
  expect_eq_str(format_number(-0.0), "0", "format: negative zero prints 0");
  expect_eq_str(format_number(std::numeric_limits<double>::quiet_NaN()), "NaN", "format: NaN");
  expect_eq_str(format_number(std::numeric_limits<double>::infinity()), "Infinity", "format: +inf");
  expect_eq_str(format_number(-std::numeric_limits<double>::infinity()), "-Infinity", "format: -inf");
  expect_eq_str(format_number(9007199254740991.0), "9007199254740991", "format: 2^53-1");

  expect_eq_str(format_number(-0.000001), "-0.000001", "format: small negative stays plain");
  expect_eq_str(format_number(0.0000015), "0.0000015", "format: 1.5e-6 stays plain");
  expect_eq_str(format_number(1e-7), "1e-7", "format: 1e-7 uses exponent form");
  expect_eq_str(format_number(-2.5e-8), "-2.5e-8", "format: negative small exponent form");
  expect_eq_str(format_number(-1e20), "-100000000000000000000", "format: -1e20 stays plain");
  expect_eq_str(format_number(1e21), "1e+21", "format: 1e21 uses exponent form");
  expect_eq_str(format_number(1.5e300), "1.5e+300", "format: large exponent form");
  expect_eq_str(format_number(-123456789012345678.0), "-123456789012345680",
                "format: shortest digits padded with zeros");
  expect_eq_str(format_number(0.5), "0.5", "format: 0.5");

  const double third = 1.0 / 3.0;
  expect_eq_str(format_number(third), "0.3333333333333333", "format: 1/3 shortest digits");
  expect_true(std::stod(format_number(third)) == third, "format: round-trips 1/3");
}

}  // namespace
}  // namespace parcel

int main() {
  using namespace parcel;

  test_error_codes();
  test_error_throw_site();
  test_log_levels();
  test_number_format();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
