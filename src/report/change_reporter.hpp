#pragma once

#include "report/palette.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace packdoc::report {

enum class ChangeKind {
  kNoChange,
  kCreated,
  kModified,
};

enum class RunMode {
  kApply,
  kDryRun,
};

const char* ToString(ChangeKind kind);

// Outcome of one document update, consumed right away by the caller.
struct ChangeRecord {
  ChangeKind kind = ChangeKind::kNoChange;
  RunMode mode = RunMode::kApply;
  std::string label;
  std::string diff;

  // Dry runs never persist, whatever the classification.
  bool ShouldPersist() const {
    return mode == RunMode::kApply && kind != ChangeKind::kNoChange;
  }
};

// Classifies an update:
// - no prior content (absent or empty) and non-empty new text => kCreated,
//   with an all-added diff.
// - otherwise kModified when the diff engine sees a change, else kNoChange.
// Pure: performs no I/O in either mode.
ChangeRecord ClassifyAndReport(const std::optional<std::string>& old_text,
                               std::string_view new_text, std::string_view label, RunMode mode);

// Terminal report for a record: status line, then the diff when there is one.
std::string FormatChangeReport(const ChangeRecord& record, const Palette& palette,
                               std::optional<std::size_t> max_diff_lines = std::nullopt);

// `<label>: (skipped - <reason>)` for documents that were not processed.
std::string FormatSkipped(std::string_view label, std::string_view reason, const Palette& palette);

} // namespace packdoc::report
