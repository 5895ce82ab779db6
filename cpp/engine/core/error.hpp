#pragma once
/*
================================================================================
Fragment 1.2 — Core: Error Codes + Exception (parcel_sort)
FILE: cpp/engine/core/error.hpp

Purpose:
  - One stable set of error codes for the validator failure kinds and the
    throwing classifier wrapper.
  - One exception type that carries code + message + throw site.

Notes:
  - Codes 1..4 mirror the validator failure kinds. Keep values stable.
  - message() is the bare human text; what() adds code and site for logs.
================================================================================
*/

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace parcel {

enum class ErrorCode : int {
  kTypeMismatch    = 1,
  kNotFinite       = 2,
  kNotPositive     = 3,
  kTooLarge        = 4,
  kInternal        = 5,
};

inline const char* to_string(ErrorCode c) noexcept {
  switch (c) {
    case ErrorCode::kTypeMismatch:    return "TypeMismatch";
    case ErrorCode::kNotFinite:       return "NotFinite";
    case ErrorCode::kNotPositive:     return "NotPositive";
    case ErrorCode::kTooLarge:        return "TooLarge";
    case ErrorCode::kInternal:        return "Internal";
    default:                          return "Unknown";
  }
}

class Error final : public std::runtime_error {
 public:
  Error(ErrorCode code,
        std::string message,
        const char* file,
        int line,
        const char* function)
      : std::runtime_error(build_what(code, message, file, line, function)),
        code_(code),
        message_(std::move(message)),
        line_(line) {}

  ErrorCode code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }
  int line() const noexcept { return line_; }

 private:
  static std::string build_what(ErrorCode code,
                                const std::string& msg,
                                const char* file,
                                int line,
                                const char* func) {
    std::ostringstream oss;
    oss << "[parcel::Error code=" << to_string(code) << "(" << static_cast<int>(code) << ")] "
        << msg;
    if (file && *file) {
      oss << " @ " << file << ":" << line;
      if (func && *func) oss << " (" << func << ")";
    }
    return oss.str();
  }

  ErrorCode code_;
  std::string message_;
  int line_;
};

[[noreturn]] inline void throw_error(ErrorCode code,
                                    std::string message,
                                    const char* file,
                                    int line,
                                    const char* function) {
  throw Error(code, std::move(message), file, line, function);
}

}  // namespace parcel

#define PARCEL_THROW(CODE, MSG) ::parcel::throw_error((CODE), (MSG), __FILE__, __LINE__, __func__)
