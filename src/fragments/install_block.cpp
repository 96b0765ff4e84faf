#include "fragments/install_block.hpp"

#include "document/lines.hpp"

#include <algorithm>
#include <sstream>
#include <string_view>

namespace packdoc::fragments {

namespace {

struct UserDirectory {
  std::string_view platform;
  std::string_view label;
  std::string_view path;
};

constexpr UserDirectory kUserDirectories[] = {
    {"windows", "Windows", "%APPDATA%\\talon\\user"},
    {"mac", "Mac", "~/.talon/user"},
    {"linux", "Linux", "~/.talon/user"},
};

bool DeclaresPlatform(const manifest::Manifest& manifest, std::string_view platform) {
  return std::any_of(manifest.platforms.begin(), manifest.platforms.end(),
                     [platform](const std::string& declared) {
                       return document::EqualsIgnoreCase(declared, platform);
                     });
}

} // namespace

std::string BuildInstallationMarkdown(const manifest::Manifest& manifest) {
  const std::string folder = manifest.name.has_value() && !manifest.name->empty()
                                 ? "`" + *manifest.name + "`"
                                 : std::string("this package");

  // Packages without declared platforms get every known user directory.
  bool any_declared = false;
  for (const auto& dir : kUserDirectories) {
    any_declared = any_declared || DeclaresPlatform(manifest, dir.platform);
  }

  std::ostringstream out;
  out << "## Installation\n"
      << '\n'
      << "1. Download or clone " << folder << ".\n"
      << "2. Place the folder inside your Talon user directory:\n";
  for (const auto& dir : kUserDirectories) {
    if (any_declared && !DeclaresPlatform(manifest, dir.platform)) {
      continue;
    }
    out << "   - " << dir.label << ": `" << dir.path << "`\n";
  }
  out << "3. Talon reloads user scripts automatically; no restart is needed.";

  if (manifest.requires_talon_beta) {
    out << "\n\n> **Note:** this package requires the Talon beta.";
  }
  return out.str();
}

Fragment BuildInstallFragment(const manifest::Manifest& manifest) {
  Fragment fragment;
  fragment.kind = FragmentKind::kInstallSection;
  fragment.text = BuildInstallationMarkdown(manifest);
  fragment.applicable = manifest::InstallationApplicable(manifest);
  return fragment;
}

} // namespace packdoc::fragments
