#include "engine/sorting/validation.hpp"

#include <cmath>
#include <string>

#include "engine/core/number_format.hpp"
#include "engine/sorting/sort_limits.hpp"

namespace parcel {

namespace {

ValidationFailure make_failure(FailureKind kind,
                               std::string_view field,
                               std::string message,
                               std::optional<double> value = std::nullopt) {
  ValidationFailure f;
  f.kind = kind;
  f.field = std::string(field);
  f.message = std::move(message);
  f.value = value;
  return f;
}

}  // namespace

std::optional<ValidationFailure> validate_measurement(const FieldValue& value,
                                                      std::string_view field) {
  const std::string name(field);

  if (!value.is_number()) {
    return make_failure(FailureKind::TypeMismatch, field,
                        name + " must be a number, received " + kind_name(value.kind()));
  }

  const double x = value.number();

  if (!std::isfinite(x)) {
    return make_failure(FailureKind::NotFinite, field,
                        name + " must be a finite number, received " + format_number(x), x);
  }

  // NaN is already excluded above, so a plain <= catches zero and negatives.
  if (x <= 0.0) {
    return make_failure(FailureKind::NotPositive, field,
                        name + " must be positive, received " + format_number(x), x);
  }

  if (x > limits::max_safe_measurement) {
    return make_failure(FailureKind::TooLarge, field, name + " exceeds maximum safe value");
  }

  return std::nullopt;
}

void validate_measurement_or_throw(const FieldValue& value, std::string_view field) {
  if (auto f = validate_measurement(value, field)) {
    PARCEL_THROW(to_error_code(f->kind), std::move(f->message));
  }
}

}  // namespace parcel
