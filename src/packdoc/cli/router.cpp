#include "packdoc/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "fragments/badges.hpp"
#include "manifest/manifest.hpp"
#include "pipeline/readme_pipeline.hpp"
#include "report/palette.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace packdoc::cli {

namespace {

// Keep local names for readability while using one shared core contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

constexpr std::string_view kStageBadges = "badges";
constexpr std::string_view kStageInstall = "install";

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  packdoc generate [<dir>...] [--dry-run] [-v|--verbose] [--manifest-path <file>] "
         "[--stages <badges,install>] [--max-diff-lines <n>] [--no-color] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  packdoc shields [<dir>...] [--manifest-path <file>]\n"
      << "  packdoc version\n";
}

// Comma-separated stage list; at least one stage, no unknown names.
bool ParseStages(std::string_view raw, merge::Stages& stages, std::string& error) {
  stages = merge::Stages{false, false};
  std::size_t start = 0;
  while (start <= raw.size()) {
    const std::size_t comma = raw.find(',', start);
    const std::string_view name =
        raw.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
    if (name == kStageBadges) {
      stages.badges = true;
    } else if (name == kStageInstall) {
      stages.install = true;
    } else {
      error = "unknown stage '" + std::string(name) + "' (expected badges|install)";
      return false;
    }
    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1;
  }
  return true;
}

bool ParsePositiveSize(std::string_view raw, std::size_t& value) {
  std::size_t parsed = 0;
  const auto result = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (result.ec != std::errc() || result.ptr != raw.data() + raw.size() || parsed == 0U) {
    return false;
  }
  value = parsed;
  return true;
}

// Parse `generate` args with an explicit contract:
// - zero or more package directories (default `.`)
// - flags may appear anywhere; unknown flags are usage errors.
bool ParseGenerateOptions(const std::vector<std::string_view>& args, GenerateOptions& options,
                          std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--dry-run") {
      options.dry_run = true;
      continue;
    }
    if (token == "--verbose" || token == "-v") {
      options.verbose = true;
      continue;
    }
    if (token == "--no-color") {
      options.no_color = true;
      continue;
    }
    if (token == "--manifest-path") {
      if (i + 1 >= args.size()) {
        error = "missing value for --manifest-path";
        return false;
      }
      options.manifest_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--stages") {
      if (i + 1 >= args.size()) {
        error = "missing value for --stages";
        return false;
      }
      if (!ParseStages(args[i + 1], options.stages, error)) {
        return false;
      }
      ++i;
      continue;
    }
    if (token == "--max-diff-lines") {
      if (i + 1 >= args.size()) {
        error = "missing value for --max-diff-lines";
        return false;
      }
      std::size_t max_lines = 0;
      if (!ParsePositiveSize(args[i + 1], max_lines)) {
        error = "invalid --max-diff-lines '" + std::string(args[i + 1]) +
                "' (expected a positive integer)";
        return false;
      }
      options.max_diff_lines = max_lines;
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    options.package_dirs.emplace_back(token);
  }

  if (options.package_dirs.empty()) {
    options.package_dirs.emplace_back(".");
  }
  return true;
}

struct ShieldsOptions {
  std::vector<fs::path> package_dirs;
  std::optional<fs::path> manifest_path;
};

bool ParseShieldsOptions(const std::vector<std::string_view>& args, ShieldsOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--manifest-path") {
      if (i + 1 >= args.size()) {
        error = "missing value for --manifest-path";
        return false;
      }
      options.manifest_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    options.package_dirs.emplace_back(token);
  }

  if (options.package_dirs.empty()) {
    options.package_dirs.emplace_back(".");
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "packdoc 0.1.0\n";
  return kExitSuccess;
}

int CommandGenerate(const std::vector<std::string_view>& args, bool color_enabled) {
  GenerateOptions options;
  std::string error;
  if (!ParseGenerateOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  return ExecuteGenerate(options, color_enabled, nullptr);
}

int CommandShields(const std::vector<std::string_view>& args) {
  ShieldsOptions options;
  std::string error;
  if (!ParseShieldsOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger;
  std::size_t failed = 0;
  for (const fs::path& package_dir : options.package_dirs) {
    const core::logging::ScopedPackage package_scope(logger, package_dir.string());
    const fs::path manifest_path =
        options.manifest_path.has_value()
            ? *options.manifest_path
            : package_dir / std::string(manifest::kManifestFileName);

    manifest::Manifest manifest;
    core::errors::ErrorKind error_kind = core::errors::ErrorKind::kNone;
    if (!manifest::LoadManifestFile(manifest_path, manifest, error_kind, error)) {
      logger.Error("manifest load failed",
                   {{"path", manifest_path.string()},
                    {"error_kind", core::errors::ToString(error_kind)},
                    {"error", error}});
      std::cerr << "error: " << package_dir.string() << ": " << error << '\n';
      ++failed;
      continue;
    }

    std::cout << "\nShields for " << package_dir.string() << ":\n"
              << fragments::FormatBadgeDisplayBlock(fragments::BuildBadgeLines(manifest));
  }

  return failed == 0U ? kExitSuccess : kExitFailure;
}

} // namespace

int ExecuteGenerate(const GenerateOptions& options, bool color_enabled, BatchSummary* summary) {
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  if (options.log_level.has_value()) {
    level = *options.log_level;
  } else if (options.verbose) {
    level = core::logging::LogLevel::kDebug;
  }
  core::logging::Logger logger(level);

  pipeline::DocumentOptions document_options;
  document_options.mode = options.dry_run ? report::RunMode::kDryRun : report::RunMode::kApply;
  document_options.stages = options.stages;
  document_options.manifest_path = options.manifest_path;
  document_options.palette = report::MakePalette(color_enabled && !options.no_color);
  document_options.max_diff_lines = options.max_diff_lines;

  if (options.dry_run && options.verbose) {
    std::cout << "DRY RUN MODE - No files will be modified\n\n";
  }

  BatchSummary batch;
  batch.total = options.package_dirs.size();
  const bool announce = options.verbose || batch.total > 1U;

  for (const fs::path& package_dir : options.package_dirs) {
    const core::logging::ScopedPackage package_scope(logger, package_dir.string());
    if (announce) {
      std::cout << "package: " << package_dir.string() << '\n';
    }

    const pipeline::DocumentOutcome outcome =
        pipeline::ProcessPackageDirectory(package_dir, document_options, logger, std::cout);
    if (outcome.ok) {
      ++batch.succeeded;
      batch.written += outcome.written ? 1U : 0U;
      batch.skipped += outcome.skipped ? 1U : 0U;
      continue;
    }

    ++batch.failed;
    logger.Error("package failed",
                 {{"error_kind", core::errors::ToString(outcome.error_kind)},
                  {"error", outcome.error}});
    std::cerr << "error: " << package_dir.string() << ": " << outcome.error << '\n';
  }

  if (announce) {
    std::cout << "\nprocessed " << batch.succeeded << '/' << batch.total
              << " directories successfully\n";
  }
  logger.Info("batch finished",
              {{"total", std::to_string(batch.total)},
               {"succeeded", std::to_string(batch.succeeded)},
               {"failed", std::to_string(batch.failed)},
               {"written", std::to_string(batch.written)},
               {"skipped", std::to_string(batch.skipped)}});

  if (summary != nullptr) {
    *summary = batch;
  }
  return batch.failed == 0U ? kExitSuccess : kExitFailure;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "generate") {
    // Presentation environment is read once per process invocation.
    return CommandGenerate(args, report::ColorEnabledFromEnvironment());
  }

  if (command == "shields") {
    return CommandShields(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace packdoc::cli
