#pragma once
/*
================================================================================
Fragment 2.2 — Sorting: Measurement Validator
FILE: cpp/engine/sorting/validation.hpp

Checks, in this order, stopping at the first failure:
  1) kind is number            -> TypeMismatch ("<f> must be a number, received <kind>")
  2) finite                    -> NotFinite    ("<f> must be a finite number, received <v>")
  3) strictly positive         -> NotPositive  ("<f> must be positive, received <v>")
  4) <= 2^53 - 1               -> TooLarge     ("<f> exceeds maximum safe value")

The field name is used only to build the message.
================================================================================
*/

#include <optional>
#include <string_view>

#include "engine/sorting/sort_types.hpp"

namespace parcel {

// nullopt when value is an acceptable measurement.
std::optional<ValidationFailure> validate_measurement(const FieldValue& value,
                                                      std::string_view field);

// Throws parcel::Error with the failure's code and message.
void validate_measurement_or_throw(const FieldValue& value, std::string_view field);

}  // namespace parcel
