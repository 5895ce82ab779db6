#pragma once
/*
================================================================================
Fragment 2.1 — Sorting: Fixed Thresholds + Input Limits
FILE: cpp/engine/sorting/sort_limits.hpp

Purpose:
  - Single home for every number the sorting rule depends on.
  - Units: dimensions in centimeters, mass in kilograms.

Hardening:
  - Header-only constexpr constants. Not configurable at runtime.
  - All thresholds are inclusive (value >= threshold qualifies).
================================================================================
*/

namespace parcel::limits {

// Bulky: volume (cm^3) at or above this.
inline constexpr double bulky_volume_cm3 = 1'000'000.0;

// Bulky: any single dimension (cm) at or above this.
inline constexpr double bulky_dimension_cm = 150.0;

// Heavy: mass (kg) at or above this.
inline constexpr double heavy_mass_kg = 20.0;

// Largest accepted measurement: 2^53 - 1, the last integer a double holds exactly.
inline constexpr double max_safe_measurement = 9007199254740991.0;

} // namespace parcel::limits
