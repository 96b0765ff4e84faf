#pragma once

#include "core/errors/error_kind.hpp"
#include "core/logging/logger.hpp"
#include "merge/merge_engine.hpp"
#include "report/change_reporter.hpp"
#include "report/palette.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace packdoc::pipeline {

constexpr std::string_view kReadmeFileName = "README.md";
constexpr std::string_view kPreviewImageFileName = "preview.png";

struct DocumentOptions {
  report::RunMode mode = report::RunMode::kApply;
  merge::Stages stages;
  // Replaces `<dir>/manifest.json` when set.
  std::optional<std::filesystem::path> manifest_path;
  report::Palette palette;
  std::optional<std::size_t> max_diff_lines;
};

struct DocumentOutcome {
  bool ok = false;
  bool skipped = false;
  bool written = false;
  core::errors::ErrorKind error_kind = core::errors::ErrorKind::kNone;
  std::string error;
};

// Runs load -> merge -> diff -> report -> persist for one package directory.
//
// Contract:
// - report text goes to `out`; failures are returned, never thrown.
// - the README is written only in apply mode and only when it changed, via
//   an atomic temp-file rename.
// - a failed manifest load never touches the README.
// - in dry-run mode a missing manifest is reported as skipped and counts as ok.
DocumentOutcome ProcessPackageDirectory(const std::filesystem::path& package_dir,
                                        const DocumentOptions& options,
                                        core::logging::Logger& logger, std::ostream& out);

} // namespace packdoc::pipeline
