#pragma once

#include "core/errors/error_kind.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packdoc::manifest {

constexpr std::string_view kManifestFileName = "manifest.json";
constexpr std::string_view kDefaultVersion = "0.0.0";

enum class StatusKind {
  kStable,
  kPreview,
  kExperimental,
  kPrototype,
  kReference,
  kDeprecated,
  kArchived,
  kUnknown,
};

// Package metadata consumed by the fragment generators.
//
// Design notes:
// - Fields with an unexpected JSON type are treated as unset rather than as a
//   hard error; only unreadable JSON or a non-object root fail the load.
// - `status` is stored lower-cased so comparisons never care about casing.
struct Manifest {
  std::optional<std::string> name;
  std::optional<std::string> title;
  std::optional<std::string> description;
  std::string version = std::string(kDefaultVersion);
  std::string status;
  std::vector<std::string> platforms;
  bool requires_talon_beta = false;
};

StatusKind ClassifyStatus(std::string_view status);

// Reference, deprecated and archived packages never get install instructions.
bool InstallationApplicable(const Manifest& manifest);

// Parses manifest JSON text. Returns false on invalid JSON or non-object root.
bool ParseManifestText(std::string_view json_text, Manifest& manifest, std::string& error);

// Loads and parses a manifest file.
//
// Contract:
// - missing file => kMissingInput
// - unreadable file => kIoFailure
// - invalid content => kMalformedInput
bool LoadManifestFile(const std::filesystem::path& manifest_path, Manifest& manifest,
                      core::errors::ErrorKind& error_kind, std::string& error);

} // namespace packdoc::manifest
