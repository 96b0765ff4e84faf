#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using packdoc::tests::common::AssertContains;
using packdoc::tests::common::AssertNotContains;
using packdoc::tests::common::DispatchCaptured;
using packdoc::tests::common::Fail;
using packdoc::tests::common::WriteStringToFile;

int main() {
  const fs::path root = packdoc::tests::common::CreateUniqueTempDir("packdoc-logging-contract");
  const fs::path package = root / "pkg";
  fs::create_directories(package);
  WriteStringToFile(package / "manifest.json", "{\"name\": \"pkg\"}\n");

  std::string out;
  std::string err;
  int exit_code = DispatchCaptured(
      {"packdoc", "generate", package.string(), "--no-color", "--log-level", "debug"}, out, err);
  if (exit_code != 0) {
    Fail("generate failed in logging contract test: " + err);
  }

  AssertContains(err, "level=DEBUG");
  AssertContains(err, "level=INFO");
  AssertContains(err, "package=\"" + package.string() + "\"");
  AssertContains(err, "msg=\"document classified\"");
  AssertContains(err, "change=\"created\"");
  AssertContains(err, "msg=\"merge pass\" action=\"composed new document\"");
  AssertContains(err, "msg=\"batch finished\"");
  AssertContains(err, "written=\"1\" skipped=\"0\"");

  // --verbose implies debug records; --log-level error silences them.
  exit_code = DispatchCaptured({"packdoc", "generate", package.string(), "--no-color", "-v"}, out,
                               err);
  if (exit_code != 0) {
    Fail("verbose generate failed: " + err);
  }
  AssertContains(err, "level=DEBUG");
  AssertContains(err, "change=\"no_change\"");
  AssertContains(err, "written=\"0\" skipped=\"0\"");
  AssertContains(out, "package: " + package.string() + "\n");

  exit_code = DispatchCaptured(
      {"packdoc", "generate", package.string(), "--no-color", "--log-level", "error"}, out, err);
  if (exit_code != 0) {
    Fail("quiet generate failed: " + err);
  }
  AssertNotContains(err, "level=INFO");

  exit_code = DispatchCaptured(
      {"packdoc", "generate", package.string(), "--log-level", "chatty"}, out, err);
  if (exit_code != 2) {
    Fail("invalid --log-level should be a usage error");
  }
  AssertContains(err, "invalid --log-level 'chatty'");

  packdoc::tests::common::RemovePathBestEffort(root);
  std::cout << "logging_contract_smoke: ok\n";
  return 0;
}
