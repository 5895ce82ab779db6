/*
  Sorting Selftest

  Objective
  ---------
  Framework-free checks for the package sorting rule:
    1) Decision table and inclusive boundaries (150 cm, 20 kg, 1e6 cm^3).
    2) Validator failure kinds and messages, in the fixed check order.
    3) First offending field (width, height, length, mass) is the one reported.
    4) Monotonic in width; repeated calls give identical results.
    5) Throwing wrapper carries the matching error code.

  Non-zero return code indicates failure.
*/

#include <array>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "engine/core/error.hpp"
#include "engine/sorting/classifier.hpp"
#include "engine/sorting/sort_limits.hpp"
#include "engine/sorting/validation.hpp"

namespace parcel {
namespace {

static int g_fail_count = 0;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

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

void expect_category(double w, double h, double l, double m, Category exp, std::string_view msg) {
  const SortResult r = classify(w, h, l, m);
  if (!r.ok()) {
    fail(msg);
    std::cerr << "  unexpected failure: " << r.failure().message << "\n";
    return;
  }
  if (r.category() != exp) {
    fail(msg);
    std::cerr << "  expected " << to_string(exp) << ", got " << to_string(r.category()) << "\n";
    return;
  }
  pass(msg);
}

// Expect classify() to fail with kind on field, and (if non-empty) exact message.
void expect_failure(const SortResult& r,
                    FailureKind kind,
                    const std::string& field,
                    const std::string& message,
                    std::string_view msg) {
  if (r.ok()) {
    fail(msg);
    std::cerr << "  expected failure, got " << to_string(r.category()) << "\n";
    return;
  }
  const ValidationFailure& f = r.failure();
  if (f.kind != kind || f.field != field || (!message.empty() && f.message != message)) {
    fail(msg);
    std::cerr << "  got kind=" << to_string(f.kind) << " field=" << f.field
              << " message=\"" << f.message << "\"\n";
    return;
  }
  pass(msg);
}

void test_decision_table() {
  expect_category(50, 50, 50, 10, Category::Standard, "small and light -> STANDARD");
  expect_category(1, 1, 1, 0.1, Category::Standard, "tiny -> STANDARD");
  expect_category(149, 10, 10, 19, Category::Standard, "just under both -> STANDARD");

  expect_category(150, 50, 50, 10, Category::Special, "bulky by width -> SPECIAL");
  expect_category(50, 150, 50, 10, Category::Special, "bulky by height -> SPECIAL");
  expect_category(50, 50, 150, 10, Category::Special, "bulky by length -> SPECIAL");
  expect_category(100, 100, 100, 10, Category::Special, "bulky by volume -> SPECIAL");

  expect_category(50, 50, 50, 20, Category::Special, "heavy at threshold -> SPECIAL");
  expect_category(10, 10, 10, 100, Category::Special, "heavy only -> SPECIAL");

  expect_category(150, 150, 150, 20, Category::Rejected, "bulky and heavy -> REJECTED");
  expect_category(150, 1, 1, 20, Category::Rejected, "bulky by dimension, heavy by mass -> REJECTED");
  expect_category(100, 100, 100, 20, Category::Rejected, "bulky by volume and heavy -> REJECTED");
  expect_category(50, 50, 150, 25, Category::Rejected, "bulky by length and heavy -> REJECTED");
}

void test_boundaries() {
  expect_category(150, 1, 1, 1, Category::Special, "width == 150 is bulky");
  expect_category(1, 150, 1, 1, Category::Special, "height == 150 is bulky");
  expect_category(1, 1, 150, 1, Category::Special, "length == 150 is bulky");
  expect_category(149.99, 1, 1, 1, Category::Standard, "width 149.99 is not bulky");
  expect_category(150.01, 1, 1, 1, Category::Special, "width 150.01 is bulky");

  expect_category(1, 1, 1, 20, Category::Special, "mass == 20 is heavy");
  expect_category(1, 1, 1, 19.99, Category::Standard, "mass 19.99 is not heavy");
  expect_category(1, 1, 1, 20.01, Category::Special, "mass 20.01 is heavy");

  expect_category(100, 100, 100, 1, Category::Special, "volume == 1e6 is bulky");
  expect_category(99.99, 100, 100, 1, Category::Standard, "volume 999900 is not bulky");
  expect_category(100.01, 100, 100, 1, Category::Special, "volume 1000100 is bulky");
  expect_category(99, 101, 100.99, 1, Category::Special, "volume over 1e6 with no dimension >= 150");

  expect_category(149.99, 1, 1, 19.99, Category::Standard, "both just under -> STANDARD");
}

void test_decision_detail() {
  const SortResult r = classify(200, 1, 1, 1);
  expect_true(r.ok(), "classify(200,1,1,1) ok");
  if (!r.ok()) return;

  // Volume is computed even when one dimension already makes the package bulky.
  const SortDecision& d = r.decision();
  expect_true(d.volume_cm3 == 200.0, "volume computed alongside dimension rule");
  expect_true(d.is_bulky && !d.is_heavy, "bulky, not heavy");

  PackageSpec spec;
  spec.width_cm = 100;
  spec.height_cm = 100;
  spec.length_cm = 100;
  spec.mass_kg = 20;
  const SortDecision d2 = decide(spec);
  expect_true(d2.volume_cm3 == limits::bulky_volume_cm3, "decide(): volume exactly at threshold");
  expect_true(d2.is_bulky && d2.is_heavy && d2.category == Category::Rejected, "decide(): REJECTED");
}

void test_validator_kinds() {
  expect_failure(classify(FieldValue::text(), 50.0, 50.0, 10.0),
                 FailureKind::TypeMismatch, "width", "width must be a number, received text",
                 "text width -> TypeMismatch");
  expect_failure(classify(50.0, FieldValue::null(), 50.0, 10.0),
                 FailureKind::TypeMismatch, "height", "height must be a number, received null",
                 "null height -> TypeMismatch");
  expect_failure(classify(50.0, 50.0, FieldValue::undefined(), 10.0),
                 FailureKind::TypeMismatch, "length", "length must be a number, received undefined",
                 "missing length -> TypeMismatch");
  expect_failure(classify(50.0, 50.0, 50.0, FieldValue::object()),
                 FailureKind::TypeMismatch, "mass", "mass must be a number, received object",
                 "object mass -> TypeMismatch");
  expect_failure(classify(50.0, 50.0, 50.0, FieldValue::boolean()),
                 FailureKind::TypeMismatch, "mass", "mass must be a number, received boolean",
                 "boolean mass -> TypeMismatch");

  expect_failure(classify(kNaN, 50, 50, 10), FailureKind::NotFinite, "width",
                 "width must be a finite number, received NaN", "NaN width -> NotFinite");
  expect_failure(classify(50, kInf, 50, 10), FailureKind::NotFinite, "height",
                 "height must be a finite number, received Infinity", "+inf height -> NotFinite");
  expect_failure(classify(50, 50, -kInf, 10), FailureKind::NotFinite, "length",
                 "length must be a finite number, received -Infinity", "-inf length -> NotFinite");

  expect_failure(classify(-10, 50, 50, 10), FailureKind::NotPositive, "width",
                 "width must be positive, received -10", "negative width -> NotPositive");
  expect_failure(classify(50, 0, 50, 10), FailureKind::NotPositive, "height",
                 "height must be positive, received 0", "zero height -> NotPositive");
  expect_failure(classify(50, 50, 50, -0.0), FailureKind::NotPositive, "mass",
                 "mass must be positive, received 0", "negative zero mass -> NotPositive");
  expect_failure(classify(50, 50, 50, -0.5), FailureKind::NotPositive, "mass",
                 "mass must be positive, received -0.5", "negative mass -> NotPositive");
  expect_failure(classify(-0.000001, 1, 1, 1), FailureKind::NotPositive, "width",
                 "width must be positive, received -0.000001", "tiny negative width echoed in plain form");
  expect_failure(classify(1, -1e20, 1, 1), FailureKind::NotPositive, "height",
                 "height must be positive, received -100000000000000000000",
                 "large negative height echoed without exponent");
  expect_failure(classify(1, 1, 1, -1e21), FailureKind::NotPositive, "mass",
                 "mass must be positive, received -1e+21", "negative mass past 1e21 uses exponent form");

  expect_failure(classify(limits::max_safe_measurement * 2.0, 50, 50, 10), FailureKind::TooLarge,
                 "width", "width exceeds maximum safe value", "huge width -> TooLarge");
  expect_failure(classify(50, 50, 50, 1e300), FailureKind::TooLarge,
                 "mass", "mass exceeds maximum safe value", "huge mass -> TooLarge");

  // Upper bound is inclusive.
  const SortResult at_max = classify(limits::max_safe_measurement, 1, 1, 1);
  expect_true(at_max.ok() && at_max.category() == Category::Special, "2^53-1 accepted (bulky)");
}

void test_validator_values() {
  const auto bad = validate_measurement(FieldValue(-1.0), "width");
  expect_true(bad.has_value() && bad->value.has_value() && *bad->value == -1.0,
              "NotPositive failure carries offending value");

  const auto big = validate_measurement(FieldValue(1e20), "mass");
  expect_true(big.has_value() && !big->value.has_value(), "TooLarge failure does not echo value");

  const auto good = validate_measurement(FieldValue(0.001), "mass");
  expect_true(!good.has_value(), "small positive value accepted");
}

void test_first_field_wins() {
  expect_failure(classify(-1, 50, 50, 10), FailureKind::NotPositive, "width",
                 "width must be positive, received -1", "negative width reported");
  expect_failure(classify(-1, kNaN, FieldValue::text(), -5.0), FailureKind::NotPositive, "width",
                 "width must be positive, received -1", "width reported before later bad fields");
  expect_failure(classify(50, -2, kNaN, 0), FailureKind::NotPositive, "height", "",
                 "height reported before length and mass");
  expect_failure(classify(50, 50, kNaN, 0), FailureKind::NotFinite, "length", "",
                 "length reported before mass");
}

void test_monotonic_in_width() {
  const std::array<double, 3> masses{1.0, 19.99, 20.0};
  const std::array<double, 3> heights{1.0, 50.0, 100.0};

  bool monotonic = true;
  for (double m : masses) {
    for (double h : heights) {
      int prev = -1;
      for (double w = 1.0; w <= 400.0; w += 0.5) {
        const SortResult r = classify(w, h, 100.0, m);
        if (!r.ok()) { monotonic = false; break; }
        const int rank = static_cast<int>(r.category());
        if (rank < prev) { monotonic = false; break; }
        prev = rank;
      }
    }
  }
  expect_true(monotonic, "increasing width never moves category backward");
}

void test_idempotent() {
  const SortResult a = classify(120.5, 80.25, 99.0, 19.5);
  const SortResult b = classify(120.5, 80.25, 99.0, 19.5);
  expect_true(a.ok() && b.ok(), "repeat calls ok");
  if (!a.ok() || !b.ok()) return;
  expect_true(a.category() == b.category(), "repeat calls same category");
  expect_true(a.decision().volume_cm3 == b.decision().volume_cm3, "repeat calls same volume");

  const SortResult f1 = classify(kNaN, 1, 1, 1);
  const SortResult f2 = classify(kNaN, 1, 1, 1);
  expect_true(!f1.ok() && !f2.ok() && f1.failure().message == f2.failure().message,
              "repeat failing calls same message");
}

void test_throwing_wrapper() {
  expect_true(classify_or_throw(150.0, 150.0, 150.0, 25.0) == Category::Rejected,
              "classify_or_throw returns category");

  try {
    (void)classify_or_throw(-10.0, 50.0, 50.0, 10.0);
    fail("classify_or_throw must throw on invalid width");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kNotPositive, "classify_or_throw: NotPositive code");
    expect_eq_str(e.message(), "width must be positive, received -10", "classify_or_throw: message");
  }

  try {
    validate_measurement_or_throw(FieldValue::text(), "height");
    fail("validate_measurement_or_throw must throw on text");
  } catch (const Error& e) {
    expect_true(e.code() == ErrorCode::kTypeMismatch, "validate_measurement_or_throw: TypeMismatch code");
  }
}

void test_category_strings() {
  expect_eq_str(to_string(Category::Standard), "STANDARD", "STANDARD label");
  expect_eq_str(to_string(Category::Special), "SPECIAL", "SPECIAL label");
  expect_eq_str(to_string(Category::Rejected), "REJECTED", "REJECTED label");
  expect_true(parse_category("SPECIAL") == Category::Special, "parse_category SPECIAL");
  expect_true(!parse_category("special").has_value(), "parse_category is exact");
}

}  // namespace
}  // namespace parcel

int main() {
  using namespace parcel;

  test_decision_table();
  test_boundaries();
  test_decision_detail();
  test_validator_kinds();
  test_validator_values();
  test_first_field_wins();
  test_monotonic_in_width();
  test_idempotent();
  test_throwing_wrapper();
  test_category_strings();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
