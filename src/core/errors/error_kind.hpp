#pragma once

#include <string_view>

namespace packdoc::core::errors {

// Per-document failure classes. A missing insertion anchor is not listed:
// the locator always falls back to end-of-document.
enum class ErrorKind {
  kNone,
  kMissingInput,
  kMalformedInput,
  kIoFailure,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kMissingInput:
    return "missing_input";
  case ErrorKind::kMalformedInput:
    return "malformed_input";
  case ErrorKind::kIoFailure:
    return "io_failure";
  }
  return "none";
}

} // namespace packdoc::core::errors
