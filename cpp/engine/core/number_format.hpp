#pragma once

#include <string>

namespace parcel {

// Shortest decimal text that parses back to the same double.
// Plain notation for decimal exponents -6..20 (0.000001, 100000000000000000000),
// exponent form outside it (1e-7, 1e+21).
// Non-finite values print as "NaN", "Infinity", "-Infinity"; -0 prints as "0".
std::string format_number(double x);

}  // namespace parcel
