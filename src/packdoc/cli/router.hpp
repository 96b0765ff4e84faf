#pragma once

#include "core/logging/logger.hpp"
#include "merge/merge_engine.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace packdoc::cli {

// Options for `packdoc generate`, shared with in-process callers so batch
// behavior does not drift from the CLI.
struct GenerateOptions {
  std::vector<std::filesystem::path> package_dirs;
  bool dry_run = false;
  bool verbose = false;
  bool no_color = false;
  std::optional<std::filesystem::path> manifest_path;
  merge::Stages stages;
  std::optional<std::size_t> max_diff_lines;
  std::optional<core::logging::LogLevel> log_level;
};

// Aggregate of one batch; `failed > 0` maps to a non-zero exit code.
struct BatchSummary {
  std::size_t total = 0;
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  // Subsets of `succeeded`.
  std::size_t written = 0;
  std::size_t skipped = 0;
};

// Processes every package directory in order. A failing directory is
// reported and counted; the remaining directories still run.
int ExecuteGenerate(const GenerateOptions& options, bool color_enabled, BatchSummary* summary);

// Routes `packdoc` subcommands and returns process exit codes with a stable
// contract for scripts and CI:
//   0 => success
//   1 => at least one package directory failed
//   2 => usage error (unknown command / invalid args)
int Dispatch(int argc, char** argv);

} // namespace packdoc::cli
