#include "engine/core/number_format.hpp"

#include <charconv>
#include <cstddef>
#include <cmath>
#include <cstdlib>
#include <string_view>
#include <system_error>

namespace parcel {

namespace {

// Decimal exponents in [kMinFixedExp, kMaxFixedExp] print without an exponent.
constexpr int kMinFixedExp = -6;
constexpr int kMaxFixedExp = 20;

// Shortest digits of |x| in scientific form: "d.ddde[+-]XX" split into
// the digit string (no point) and the decimal exponent of the first digit.
bool shortest_digits(double x, std::string* digits, int* exp10) {
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), x, std::chars_format::scientific);
  if (res.ec != std::errc()) return false;

  const std::string_view s(buf, static_cast<std::size_t>(res.ptr - buf));
  const std::size_t e = s.find('e');
  if (e == std::string_view::npos) return false;

  digits->clear();
  for (std::size_t i = 0; i < e; ++i) {
    if (s[i] != '.') digits->push_back(s[i]);
  }
  while (digits->size() > 1 && digits->back() == '0') digits->pop_back();

  *exp10 = std::atoi(std::string(s.substr(e + 1)).c_str());
  return true;
}

}  // namespace

std::string format_number(double x) {
  if (std::isnan(x)) return "NaN";
  if (std::isinf(x)) return (x > 0.0) ? "Infinity" : "-Infinity";
  if (x == 0.0) return "0";

  std::string digits;
  int exp10 = 0;
  if (!shortest_digits(std::fabs(x), &digits, &exp10)) return std::to_string(x);

  std::string out;
  if (x < 0.0) out.push_back('-');

  const int k = static_cast<int>(digits.size());
  const int n = exp10 + 1;  // digits before the decimal point

  if (exp10 >= kMinFixedExp && exp10 <= kMaxFixedExp) {
    if (n >= k) {
      out += digits;
      out.append(static_cast<std::size_t>(n - k), '0');
    } else if (n > 0) {
      out.append(digits, 0, static_cast<std::size_t>(n));
      out.push_back('.');
      out.append(digits, static_cast<std::size_t>(n), std::string::npos);
    } else {
      out += "0.";
      out.append(static_cast<std::size_t>(-n), '0');
      out += digits;
    }
    return out;
  }

  out.push_back(digits[0]);
  if (k > 1) {
    out.push_back('.');
    out.append(digits, 1, std::string::npos);
  }
  out.push_back('e');
  out.push_back(exp10 < 0 ? '-' : '+');
  out += std::to_string(exp10 < 0 ? -exp10 : exp10);
  return out;
}

}  // namespace parcel
