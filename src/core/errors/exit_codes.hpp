#pragma once

namespace packdoc::core::errors {

// Stable process-exit contract for CLI automation.
//
// Batch runs keep going after a failed package directory, so the process exit
// code is an aggregate: any failed document turns the run into kFailure.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace packdoc::core::errors
