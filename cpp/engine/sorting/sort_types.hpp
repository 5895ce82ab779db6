#pragma once
/*
================================================================================
Fragment 2.0 — Sorting: Data Model
FILE: cpp/engine/sorting/sort_types.hpp

Purpose:
  Explicit types for one package classification call:
    1) FieldValue      - a raw input as handed over by a dynamically typed caller
    2) PackageSpec     - four measurements (cm, cm, cm, kg)
    3) Category        - STANDARD / SPECIAL / REJECTED
    4) SortDecision    - category plus the derivation (volume, bulky, heavy)
    5) ValidationFailure + SortResult - tagged outcome of classify()

Hardening rules:
  - Nothing here is long-lived. Every value is built per call and discarded.
  - SortResult holds exactly one of {decision, failure}.

Note:
  This header defines *types only*. Validation lives in validation.*,
  the decision rule in classifier.*.
================================================================================
*/

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "engine/core/error.hpp"

namespace parcel {

enum class Category : int {
  Standard = 0,
  Special  = 1,
  Rejected = 2
};

inline const char* to_string(Category c) noexcept {
  switch (c) {
    case Category::Standard: return "STANDARD";
    case Category::Special:  return "SPECIAL";
    case Category::Rejected: return "REJECTED";
    default:                 return "UNKNOWN";
  }
}

inline std::optional<Category> parse_category(std::string_view s) noexcept {
  if (s == "STANDARD") return Category::Standard;
  if (s == "SPECIAL")  return Category::Special;
  if (s == "REJECTED") return Category::Rejected;
  return std::nullopt;
}

// Runtime kind of a raw input value.
enum class ValueKind : std::uint8_t {
  Undefined = 0,  // field not supplied at all
  Null      = 1,
  Boolean   = 2,
  Number    = 3,
  Text      = 4,
  Object    = 5
};

// Name used in "must be a number, received <kind>" messages.
inline const char* kind_name(ValueKind k) noexcept {
  switch (k) {
    case ValueKind::Undefined: return "undefined";
    case ValueKind::Null:      return "null";
    case ValueKind::Boolean:   return "boolean";
    case ValueKind::Number:    return "number";
    case ValueKind::Text:      return "text";
    case ValueKind::Object:    return "object";
    default:                   return "unknown";
  }
}

// A raw, not yet validated input. Only the runtime kind and, for numbers, the
// value are kept. Implicitly constructible from double so typed callers can
// pass plain numbers.
class FieldValue final {
 public:
  FieldValue() = default;
  FieldValue(double v) : kind_(ValueKind::Number), number_(v) {}

  static FieldValue undefined() { return FieldValue{}; }
  static FieldValue null() { return with_kind(ValueKind::Null); }
  static FieldValue boolean() { return with_kind(ValueKind::Boolean); }
  static FieldValue text() { return with_kind(ValueKind::Text); }
  static FieldValue object() { return with_kind(ValueKind::Object); }

  ValueKind kind() const noexcept { return kind_; }
  bool is_number() const noexcept { return kind_ == ValueKind::Number; }

  // Only meaningful when is_number().
  double number() const noexcept { return number_; }

 private:
  static FieldValue with_kind(ValueKind k) {
    FieldValue v;
    v.kind_ = k;
    return v;
  }

  ValueKind kind_ = ValueKind::Undefined;
  double number_ = 0.0;
};

// Four validated measurements. Dimensions in cm, mass in kg.
struct PackageSpec final {
  double width_cm = 0.0;
  double height_cm = 0.0;
  double length_cm = 0.0;
  double mass_kg = 0.0;
};

struct SortDecision final {
  double volume_cm3 = 0.0;
  bool is_bulky = false;
  bool is_heavy = false;
  Category category = Category::Standard;
};

enum class FailureKind : std::uint8_t {
  TypeMismatch = 0,
  NotFinite    = 1,
  NotPositive  = 2,
  TooLarge     = 3
};

inline const char* to_string(FailureKind k) noexcept {
  switch (k) {
    case FailureKind::TypeMismatch: return "TypeMismatch";
    case FailureKind::NotFinite:    return "NotFinite";
    case FailureKind::NotPositive:  return "NotPositive";
    case FailureKind::TooLarge:     return "TooLarge";
    default:                        return "Unknown";
  }
}

inline ErrorCode to_error_code(FailureKind k) noexcept {
  switch (k) {
    case FailureKind::TypeMismatch: return ErrorCode::kTypeMismatch;
    case FailureKind::NotFinite:    return ErrorCode::kNotFinite;
    case FailureKind::NotPositive:  return ErrorCode::kNotPositive;
    case FailureKind::TooLarge:     return ErrorCode::kTooLarge;
    default:                        return ErrorCode::kInternal;
  }
}

struct ValidationFailure final {
  FailureKind kind = FailureKind::TypeMismatch;
  std::string field;    // "width", "height", "length" or "mass"
  std::string message;  // full human text, e.g. "width must be positive, received -1"

  // Offending value, when the message echoes one (NotFinite, NotPositive).
  std::optional<double> value;
};

// Outcome of one classify() call: a decision or the first validation failure.
class SortResult final {
 public:
  SortResult(SortDecision d) : state_(d) {}
  SortResult(ValidationFailure f) : state_(std::move(f)) {}

  bool ok() const noexcept { return std::holds_alternative<SortDecision>(state_); }
  explicit operator bool() const noexcept { return ok(); }

  // Precondition: ok().
  const SortDecision& decision() const { return std::get<SortDecision>(state_); }
  Category category() const { return decision().category; }

  // Precondition: !ok().
  const ValidationFailure& failure() const { return std::get<ValidationFailure>(state_); }

 private:
  std::variant<SortDecision, ValidationFailure> state_;
};

}  // namespace parcel
