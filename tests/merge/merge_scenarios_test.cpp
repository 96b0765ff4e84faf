#include "fragments/badges.hpp"
#include "manifest/manifest.hpp"
#include "merge/merge_engine.hpp"
#include "report/change_reporter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <vector>

using packdoc::report::ChangeKind;
using packdoc::report::ClassifyAndReport;
using packdoc::report::RunMode;

namespace {

packdoc::manifest::Manifest ParseOrFail(const std::string& json) {
  packdoc::manifest::Manifest manifest;
  std::string error;
  REQUIRE(packdoc::manifest::ParseManifestText(json, manifest, error));
  return manifest;
}

} // namespace

TEST_CASE("Version bump with new platforms touches only badge lines", "[scenario]") {
  const auto manifest = ParseOrFail(
      R"({"version":"1.2.0","status":"stable","platforms":["windows","mac"]})");
  const std::vector<std::string> badges = packdoc::fragments::BuildBadgeLines(manifest);
  REQUIRE(badges.size() == 3U);

  const std::string old_version = "![Version](https://img.shields.io/badge/version-1.0.0-blue)";
  const std::string status = "![Status](https://img.shields.io/badge/status-stable-green)";
  REQUIRE(badges[1] == status);
  REQUIRE(badges[2] ==
          "![Platform](https://img.shields.io/badge/platform-windows%20%7C%20mac-lightgrey)");

  const std::string before = "# My Pack\n\n" + old_version + "\n" + status +
                             "\n\nSome prose.\n\n## Installation\n\nManual steps.\n";
  const std::string after =
      packdoc::merge::MergeAll(before, manifest, packdoc::merge::Stages{});

  const auto record = ClassifyAndReport(before, after, "README.md", RunMode::kApply);
  REQUIRE(record.kind == ChangeKind::kModified);
  REQUIRE(record.diff == "--- a/README.md\n+++ b/README.md\n"
                         "@@ -1,7 +1,8 @@\n"
                         " # My Pack\n"
                         " \n"
                         "-" + old_version + "\n"
                         "+" + badges[0] + "\n"
                         " " + status + "\n"
                         "+" + badges[2] + "\n"
                         " \n"
                         " Some prose.\n"
                         " \n");

  const auto rerun = ClassifyAndReport(
      after, packdoc::merge::MergeAll(after, manifest, packdoc::merge::Stages{}), "README.md",
      RunMode::kApply);
  REQUIRE(rerun.kind == ChangeKind::kNoChange);
}

TEST_CASE("Archived package without install heading is left alone", "[scenario]") {
  const auto manifest = ParseOrFail(R"({"status":"archived"})");
  packdoc::merge::Stages install_only;
  install_only.badges = false;

  const std::string before = "# Old Pack\n\nNo longer maintained.\n\n## License\n\nMIT\n";
  const std::string after = packdoc::merge::MergeAll(before, manifest, install_only);
  REQUIRE(after == before);

  const auto record = ClassifyAndReport(before, after, "README.md", RunMode::kApply);
  REQUIRE(record.kind == ChangeKind::kNoChange);
  REQUIRE_FALSE(record.ShouldPersist());
}

TEST_CASE("Empty document becomes a created all-added diff", "[scenario]") {
  const auto manifest = ParseOrFail(R"({"name":"fresh","status":"experimental"})");
  const std::optional<std::string> before = std::string();
  const std::string after = packdoc::merge::UpdateDocument(before, manifest,
                                                           packdoc::merge::Stages{}, false);

  const auto record = ClassifyAndReport(before, after, "README.md", RunMode::kDryRun);
  REQUIRE(record.kind == ChangeKind::kCreated);
  REQUIRE_FALSE(record.ShouldPersist());
  REQUIRE(record.diff.find("@@ -0,0 +1,") != std::string::npos);
  REQUIRE(record.diff.find("\n-") == std::string::npos);
  REQUIRE(record.diff.find("\n ") == std::string::npos);
}

TEST_CASE("Unknown status still gets an install section", "[scenario]") {
  const auto manifest = ParseOrFail(R"({"status":"beta-ish"})");
  const std::string before = "# Pack\n\nIntro\n";
  const std::string after = packdoc::merge::MergeAll(before, manifest, packdoc::merge::Stages{});
  REQUIRE(after.find("\n## Installation\n") != std::string::npos);
  REQUIRE(after.find("status-beta-ish-lightgrey") != std::string::npos);
}
