#include "pipeline/readme_pipeline.hpp"

#include "core/fs_utils.hpp"
#include "document/lines.hpp"
#include "manifest/manifest.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace packdoc::pipeline {

namespace {

DocumentOutcome Failed(core::errors::ErrorKind kind, std::string error) {
  DocumentOutcome outcome;
  outcome.ok = false;
  outcome.error_kind = kind;
  outcome.error = std::move(error);
  return outcome;
}

// Absent README yields nullopt; unreadable or non-UTF-8 content is an error.
bool LoadCurrentDocument(const fs::path& readme_path, std::optional<std::string>& current,
                         core::errors::ErrorKind& error_kind, std::string& error) {
  current.reset();

  std::error_code ec;
  const bool exists = fs::exists(readme_path, ec);
  if (ec) {
    error_kind = core::errors::ErrorKind::kIoFailure;
    error = "failed to stat '" + readme_path.string() + "': " + ec.message();
    return false;
  }
  if (!exists) {
    return true;
  }

  std::string contents;
  if (!core::ReadTextFile(readme_path, contents, error)) {
    error_kind = core::errors::ErrorKind::kIoFailure;
    return false;
  }
  if (!document::IsValidUtf8(contents)) {
    error_kind = core::errors::ErrorKind::kMalformedInput;
    error = "document is not valid UTF-8: " + readme_path.string();
    return false;
  }
  current = std::move(contents);
  return true;
}

} // namespace

DocumentOutcome ProcessPackageDirectory(const fs::path& package_dir,
                                        const DocumentOptions& options,
                                        core::logging::Logger& logger, std::ostream& out) {
  const bool dry_run = options.mode == report::RunMode::kDryRun;
  const std::string label(kReadmeFileName);

  std::error_code ec;
  if (!fs::is_directory(package_dir, ec) || ec) {
    return Failed(core::errors::ErrorKind::kIoFailure,
                  "directory not found: " + package_dir.string());
  }

  const fs::path manifest_path = options.manifest_path.has_value()
                                     ? *options.manifest_path
                                     : package_dir / std::string(manifest::kManifestFileName);
  logger.Debug("loading manifest", {{"path", manifest_path.string()}});

  manifest::Manifest manifest;
  core::errors::ErrorKind error_kind = core::errors::ErrorKind::kNone;
  std::string error;
  if (!manifest::LoadManifestFile(manifest_path, manifest, error_kind, error)) {
    if (dry_run && error_kind == core::errors::ErrorKind::kMissingInput) {
      logger.Warn("manifest missing; document skipped", {{"path", manifest_path.string()}});
      out << report::FormatSkipped(label, "manifest.json doesn't exist yet", options.palette);
      DocumentOutcome outcome;
      outcome.ok = true;
      outcome.skipped = true;
      return outcome;
    }
    return Failed(error_kind, error);
  }

  const fs::path readme_path = package_dir / label;
  std::optional<std::string> current;
  if (!LoadCurrentDocument(readme_path, current, error_kind, error)) {
    return Failed(error_kind, error);
  }

  const bool has_preview = fs::exists(package_dir / std::string(kPreviewImageFileName), ec) && !ec;

  std::vector<std::string> actions;
  const std::string updated =
      merge::UpdateDocument(current, manifest, options.stages, has_preview, &actions);
  for (const auto& action : actions) {
    logger.Debug("merge pass", {{"action", action}});
  }

  report::ChangeRecord record = report::ClassifyAndReport(current, updated, label, options.mode);
  logger.Info("document classified",
              {{"document", readme_path.string()},
               {"change", report::ToString(record.kind)},
               {"dry_run", dry_run ? "true" : "false"}});
  out << report::FormatChangeReport(record, options.palette, options.max_diff_lines);

  DocumentOutcome outcome;
  if (record.ShouldPersist()) {
    if (!core::WriteTextFileAtomic(readme_path, updated, error)) {
      return Failed(core::errors::ErrorKind::kIoFailure, error);
    }
    outcome.written = true;
    logger.Info("document written", {{"path", readme_path.string()}});
  }

  outcome.ok = true;
  return outcome;
}

} // namespace packdoc::pipeline
