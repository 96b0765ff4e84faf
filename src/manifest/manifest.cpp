#include "manifest/manifest.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <system_error>

namespace fs = std::filesystem;

namespace packdoc::manifest {

namespace {

using JsonValue = core::json::Value;

std::string ToLower(std::string_view raw) {
  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

std::optional<std::string> ReadStringField(const JsonValue& root, std::string_view key) {
  const JsonValue* value = root.Find(key);
  if (value == nullptr || value->type != JsonValue::Type::kString) {
    return std::nullopt;
  }
  return value->string_value;
}

// Either spelling set to true enables the beta requirement.
bool ReadBetaFlag(const JsonValue& root) {
  for (const std::string_view key : {"requires_talon_beta", "requiresTalonBeta"}) {
    const JsonValue* value = root.Find(key);
    if (value != nullptr && value->type == JsonValue::Type::kBool && value->bool_value) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> ReadPlatforms(const JsonValue& root) {
  std::vector<std::string> platforms;
  const JsonValue* value = root.Find("platforms");
  if (value == nullptr || value->type != JsonValue::Type::kArray) {
    return platforms;
  }
  for (const JsonValue& item : value->array_value) {
    if (item.type == JsonValue::Type::kString && !item.string_value.empty()) {
      platforms.push_back(item.string_value);
    }
  }
  return platforms;
}

} // namespace

StatusKind ClassifyStatus(std::string_view status) {
  const std::string lowered = ToLower(status);
  if (lowered == "stable") {
    return StatusKind::kStable;
  }
  if (lowered == "preview") {
    return StatusKind::kPreview;
  }
  if (lowered == "experimental") {
    return StatusKind::kExperimental;
  }
  if (lowered == "prototype") {
    return StatusKind::kPrototype;
  }
  if (lowered == "reference") {
    return StatusKind::kReference;
  }
  if (lowered == "deprecated") {
    return StatusKind::kDeprecated;
  }
  if (lowered == "archived") {
    return StatusKind::kArchived;
  }
  return StatusKind::kUnknown;
}

bool InstallationApplicable(const Manifest& manifest) {
  switch (ClassifyStatus(manifest.status)) {
  case StatusKind::kReference:
  case StatusKind::kDeprecated:
  case StatusKind::kArchived:
    return false;
  default:
    return true;
  }
}

bool ParseManifestText(std::string_view json_text, Manifest& manifest, std::string& error) {
  manifest = Manifest{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid manifest JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "manifest root must be a JSON object";
    return false;
  }

  manifest.name = ReadStringField(root, "name");
  manifest.title = ReadStringField(root, "title");
  manifest.description = ReadStringField(root, "description");
  if (const auto version = ReadStringField(root, "version"); version.has_value()) {
    manifest.version = *version;
  }
  if (const auto status = ReadStringField(root, "status"); status.has_value()) {
    manifest.status = ToLower(*status);
  }
  manifest.platforms = ReadPlatforms(root);
  manifest.requires_talon_beta = ReadBetaFlag(root);
  return true;
}

bool LoadManifestFile(const fs::path& manifest_path, Manifest& manifest,
                      core::errors::ErrorKind& error_kind, std::string& error) {
  error_kind = core::errors::ErrorKind::kNone;

  std::error_code ec;
  const bool exists = fs::exists(manifest_path, ec);
  if (ec) {
    error_kind = core::errors::ErrorKind::kIoFailure;
    error = "failed to stat manifest '" + manifest_path.string() + "': " + ec.message();
    return false;
  }
  if (!exists) {
    error_kind = core::errors::ErrorKind::kMissingInput;
    error = "manifest not found: " + manifest_path.string();
    return false;
  }
  if (!fs::is_regular_file(manifest_path, ec) || ec) {
    error_kind = core::errors::ErrorKind::kIoFailure;
    error = "manifest path must point to a regular file: " + manifest_path.string();
    return false;
  }

  std::string contents;
  if (!core::ReadTextFile(manifest_path, contents, error)) {
    error_kind = core::errors::ErrorKind::kIoFailure;
    return false;
  }

  if (!ParseManifestText(contents, manifest, error)) {
    error_kind = core::errors::ErrorKind::kMalformedInput;
    error += " (" + manifest_path.string() + ")";
    return false;
  }
  return true;
}

} // namespace packdoc::manifest
