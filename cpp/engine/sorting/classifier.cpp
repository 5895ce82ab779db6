#include "engine/sorting/classifier.hpp"

#include "engine/sorting/sort_limits.hpp"
#include "engine/sorting/validation.hpp"

namespace parcel {

namespace {

inline bool at_least(double value, double threshold) noexcept {
  return value >= threshold;
}

}  // namespace

SortDecision decide(const PackageSpec& spec) noexcept {
  SortDecision d{};

  d.volume_cm3 = spec.width_cm * spec.height_cm * spec.length_cm;

  d.is_bulky = at_least(d.volume_cm3, limits::bulky_volume_cm3) ||
               at_least(spec.width_cm, limits::bulky_dimension_cm) ||
               at_least(spec.height_cm, limits::bulky_dimension_cm) ||
               at_least(spec.length_cm, limits::bulky_dimension_cm);

  d.is_heavy = at_least(spec.mass_kg, limits::heavy_mass_kg);

  if (d.is_bulky && d.is_heavy) {
    d.category = Category::Rejected;
  } else if (d.is_bulky || d.is_heavy) {
    d.category = Category::Special;
  } else {
    d.category = Category::Standard;
  }
  return d;
}

SortResult classify(double width_cm, double height_cm, double length_cm, double mass_kg) {
  return classify(FieldValue(width_cm), FieldValue(height_cm),
                  FieldValue(length_cm), FieldValue(mass_kg));
}

SortResult classify(const FieldValue& width_cm,
                    const FieldValue& height_cm,
                    const FieldValue& length_cm,
                    const FieldValue& mass_kg) {
  if (auto f = validate_measurement(width_cm, "width")) return std::move(*f);
  if (auto f = validate_measurement(height_cm, "height")) return std::move(*f);
  if (auto f = validate_measurement(length_cm, "length")) return std::move(*f);
  if (auto f = validate_measurement(mass_kg, "mass")) return std::move(*f);

  PackageSpec spec;
  spec.width_cm = width_cm.number();
  spec.height_cm = height_cm.number();
  spec.length_cm = length_cm.number();
  spec.mass_kg = mass_kg.number();

  return decide(spec);
}

Category classify_or_throw(const FieldValue& width_cm,
                           const FieldValue& height_cm,
                           const FieldValue& length_cm,
                           const FieldValue& mass_kg) {
  const SortResult r = classify(width_cm, height_cm, length_cm, mass_kg);
  if (!r.ok()) {
    PARCEL_THROW(to_error_code(r.failure().kind), r.failure().message);
  }
  return r.category();
}

}  // namespace parcel
