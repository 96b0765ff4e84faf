#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using packdoc::tests::common::AssertContains;
using packdoc::tests::common::DispatchCaptured;
using packdoc::tests::common::Fail;
using packdoc::tests::common::WriteStringToFile;

int main() {
  const fs::path root = packdoc::tests::common::CreateUniqueTempDir("packdoc-shields");
  const fs::path package = root / "pkg";
  fs::create_directories(package);
  WriteStringToFile(package / "manifest.json",
                    "{\"version\": \"3.0.0\", \"status\": \"experimental\", "
                    "\"requires_talon_beta\": true}\n");

  std::string out;
  std::string err;
  int exit_code = DispatchCaptured({"packdoc", "shields", package.string()}, out, err);
  if (exit_code != 0) {
    Fail("shields command failed: " + err);
  }
  const std::string rule(60, '=');
  AssertContains(out, "\nShields for " + package.string() + ":\n");
  AssertContains(out, rule + "\nShield Badges (copy to README.md)\n" + rule + "\n");
  AssertContains(out, "![Version](https://img.shields.io/badge/version-3.0.0-blue)\n");
  AssertContains(out, "![Status](https://img.shields.io/badge/status-experimental-orange)\n");
  AssertContains(out, "![Talon Beta](https://img.shields.io/badge/talon%20beta-required-red)\n");

  // Explicit manifest path overrides the per-directory lookup.
  const fs::path other_manifest = root / "other.json";
  WriteStringToFile(other_manifest, "{\"version\": \"9.9.9\"}");
  exit_code = DispatchCaptured(
      {"packdoc", "shields", package.string(), "--manifest-path", other_manifest.string()}, out,
      err);
  if (exit_code != 0) {
    Fail("shields with --manifest-path failed: " + err);
  }
  AssertContains(out, "version-9.9.9-blue");

  exit_code = DispatchCaptured({"packdoc", "shields", (root / "absent").string()}, out, err);
  if (exit_code != 1) {
    Fail("shields without a manifest should exit 1");
  }
  AssertContains(err, "manifest not found");
  AssertContains(err, "level=ERROR package=\"" + (root / "absent").string() +
                          "\" msg=\"manifest load failed\"");
  AssertContains(err, "error_kind=\"missing_input\"");

  packdoc::tests::common::RemovePathBestEffort(root);
  std::cout << "shields_command_smoke: ok\n";
  return 0;
}
