#include "cli/sort_cli.hpp"

#include <array>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "engine/core/logging.hpp"
#include "engine/core/number_format.hpp"
#include "engine/sorting/classifier.hpp"

namespace parcel::cli {
namespace {

static constexpr int kExitErrorInt = static_cast<int>(ExitCode::kError);
static constexpr int kExitSuccessInt = static_cast<int>(ExitCode::kSuccess);

static constexpr std::array<const char*, 4> kFieldNames{"width", "height", "length", "mass"};

struct Args {
  std::vector<std::string> positional;
  LogLevel log_level = LogLevel::INFO;
};

static bool is_help_flag(const char* s) {
  return std::strcmp(s, "--help") == 0 || std::strcmp(s, "-h") == 0;
}

// Whole string must be a number. inf/nan spellings parse; the validator rejects them.
static bool parse_number(const char* s, double* out) {
  if (!s || !out || *s == '\0') return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  *out = v;
  return true;
}

static bool get_next(int& i, int argc, const char* const* argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, const char* const* argv, Args* a, std::string* err) {
  if (!a) return false;

  for (int i = 1; i < argc; ++i) {
    const char* k = argv[i];

    if (std::strcmp(k, "--log-level") == 0) {
      const char* v = nullptr;
      if (!get_next(i, argc, argv, &v)) { if (err) *err = "--log-level requires a value"; return false; }
      const auto lvl = parse_log_level(v);
      if (!lvl) { if (err) *err = "--log-level must be one of debug|info|warn|error"; return false; }
      a->log_level = *lvl;
      continue;
    }

    // "-10" is a value; only double-dash tokens are options.
    if (std::strncmp(k, "--", 2) == 0) {
      if (err) *err = std::string("Unknown argument: ") + k;
      return false;
    }

    a->positional.emplace_back(k);
  }
  return true;
}

}  // namespace

void print_usage(std::ostream& os) {
  os <<
    "\n"
    "Usage: parcel_sort [--log-level debug|info|warn|error] <width> <height> <length> <mass>\n"
    "\n"
    "Arguments:\n"
    "  width   Package width in centimeters (cm)\n"
    "  height  Package height in centimeters (cm)\n"
    "  length  Package length in centimeters (cm)\n"
    "  mass    Package mass in kilograms (kg)\n"
    "\n"
    "Example:\n"
    "  parcel_sort 100 100 100 20\n"
    "\n"
    "Output:\n"
    "  Returns one of: STANDARD, SPECIAL, or REJECTED\n"
    "\n";
}

int run_sort_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] && is_help_flag(argv[i])) {
      print_usage(out);
      return kExitSuccessInt;
    }
  }

  Args a{};
  std::string arg_err;
  if (!parse_args(argc, argv, &a, &arg_err)) {
    err << "Argument error: " << arg_err << "\n";
    print_usage(err);
    return kExitErrorInt;
  }
  set_log_level(a.log_level);

  if (a.positional.empty()) {
    print_usage(out);
    return kExitSuccessInt;
  }

  if (a.positional.size() != kFieldNames.size()) {
    err << "Error: Expected 4 arguments (width, height, length, mass)\n";
    err << "Received: " << a.positional.size() << " argument(s)\n\n";
    print_usage(err);
    return kExitErrorInt;
  }

  std::array<double, 4> values{};
  for (std::size_t i = 0; i < kFieldNames.size(); ++i) {
    if (!parse_number(a.positional[i].c_str(), &values[i])) {
      err << "Error: Invalid " << kFieldNames[i] << " \"" << a.positional[i]
          << "\" - must be a number\n";
      return kExitErrorInt;
    }
  }

  const SortResult r = classify(values[0], values[1], values[2], values[3]);

  // Trace goes to err; out carries only the category.
  if (log_enabled(LogLevel::DEBUG)) {
    std::ostringstream oss;
    oss << "classify width=" << format_number(values[0])
        << " height=" << format_number(values[1])
        << " length=" << format_number(values[2])
        << " mass=" << format_number(values[3]);
    if (r.ok()) {
      const SortDecision& d = r.decision();
      oss << " volume_cm3=" << format_number(d.volume_cm3)
          << " bulky=" << (d.is_bulky ? 1 : 0)
          << " heavy=" << (d.is_heavy ? 1 : 0)
          << " -> " << to_string(d.category);
    } else {
      oss << " -> " << to_string(r.failure().kind) << " (" << r.failure().field << ")";
    }
    err << format_log_line(LogLevel::DEBUG, oss.str());
  }

  if (!r.ok()) {
    err << "Validation Error: " << r.failure().message << "\n";
    return kExitErrorInt;
  }

  out << to_string(r.category()) << "\n";
  return kExitSuccessInt;
}

}  // namespace parcel::cli
