#pragma once
/*
================================================================================
Fragment 2.3 — Sorting: Package Classifier (Bulky/Heavy Decision Table)
FILE: cpp/engine/sorting/classifier.hpp

Rule (all comparisons inclusive):
  - bulky: width*height*length >= 1,000,000 cm^3, or any dimension >= 150 cm
  - heavy: mass >= 20 kg

    bulky  heavy  -> category
    no     no        STANDARD
    yes    no        SPECIAL
    no     yes       SPECIAL
    yes    yes       REJECTED

Contract:
  - Inputs are validated width, height, length, mass in that order; the first
    failing field is the only one reported and nothing is classified.
  - Volume is always computed, even when a single dimension already makes the
    package bulky, so SortDecision is the same regardless of check order.
  - Pure: no I/O, no shared state. Safe to call concurrently.
================================================================================
*/

#include "engine/sorting/sort_types.hpp"

namespace parcel {

// Decision rule on already validated measurements.
SortDecision decide(const PackageSpec& spec) noexcept;

// Validate then decide. Typed entry point.
SortResult classify(double width_cm, double height_cm, double length_cm, double mass_kg);

// Validate then decide. For callers whose inputs may not be numbers at all.
SortResult classify(const FieldValue& width_cm,
                    const FieldValue& height_cm,
                    const FieldValue& length_cm,
                    const FieldValue& mass_kg);

// Same contract as classify(); a validation failure is raised as parcel::Error.
Category classify_or_throw(const FieldValue& width_cm,
                           const FieldValue& height_cm,
                           const FieldValue& length_cm,
                           const FieldValue& mass_kg);

}  // namespace parcel
