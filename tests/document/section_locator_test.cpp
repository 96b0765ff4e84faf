#include "document/lines.hpp"
#include "document/section_locator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using packdoc::document::AnchorKind;
using packdoc::document::Locate;
using packdoc::fragments::FragmentKind;

namespace {

constexpr const char* kVersionBadge = "![Version](https://img.shields.io/badge/version-1.0.0-blue)";
constexpr const char* kStatusBadge = "![Status](https://img.shields.io/badge/status-stable-green)";

} // namespace

TEST_CASE("SplitLines keeps terminators and reproduces the input", "[document][lines]") {
  const std::string text = "a\r\nb\n\nc";
  const auto lines = packdoc::document::SplitLines(text);
  REQUIRE(lines.size() == 4U);
  REQUIRE(lines[0].text == "a");
  REQUIRE(lines[0].ending == "\r\n");
  REQUIRE(lines[2].text.empty());
  REQUIRE(lines[3].ending.empty());

  std::string rebuilt;
  for (const auto& line : lines) {
    rebuilt += line.text;
    rebuilt += line.ending;
  }
  REQUIRE(rebuilt == text);
  REQUIRE(packdoc::document::DetectLineEnding(text) == "\r\n");
  REQUIRE(packdoc::document::DetectLineEnding("no newline") == "\n");
}

TEST_CASE("Headings need 1-6 hashes followed by whitespace", "[document][lines]") {
  using packdoc::document::ParseHeading;
  REQUIRE(ParseHeading("# Title")->level == 1);
  REQUIRE(ParseHeading("###### Deep  ")->text == "Deep");
  REQUIRE_FALSE(ParseHeading("####### Too deep").has_value());
  REQUIRE_FALSE(ParseHeading("#Title").has_value());
  REQUIRE_FALSE(ParseHeading(" # Indented").has_value());
}

TEST_CASE("Whole-word matching ignores embedded words", "[document][lines]") {
  using packdoc::document::ContainsWholeWord;
  REQUIRE(ContainsWholeWord("Quick install", "Install"));
  REQUIRE(ContainsWholeWord("SETUP.py notes", "setup"));
  REQUIRE_FALSE(ContainsWholeWord("Reinstalling", "install"));
  REQUIRE_FALSE(ContainsWholeWord("Installer", "Install"));
  REQUIRE_FALSE(ContainsWholeWord("setup_helpers", "setup"));
}

TEST_CASE("Badge lines hold only recognized markers", "[document][lines]") {
  using packdoc::document::IsBadgeLine;
  REQUIRE(IsBadgeLine(kVersionBadge));
  REQUIRE(IsBadgeLine(std::string(kVersionBadge) + " " + kStatusBadge));
  REQUIRE(IsBadgeLine("![Talon Beta](https://img.shields.io/badge/talon%20beta-required-red)"));
  REQUIRE_FALSE(IsBadgeLine(std::string("See ") + kVersionBadge + " for details"));
  REQUIRE_FALSE(IsBadgeLine("![Build](https://img.shields.io/badge/build-passing-green)"));
  REQUIRE_FALSE(IsBadgeLine("![Version](https://example.com/version.svg)"));
  REQUIRE_FALSE(IsBadgeLine("The Version and Status of this package"));
}

TEST_CASE("Badge block spans blank lines between markers", "[locator][badges]") {
  const std::string doc = std::string("# Title\n\n") + kVersionBadge + "\n\n" + kStatusBadge +
                          "\n\nProse mentioning Version.\n";
  const auto location = Locate(doc, FragmentKind::kBadgeBlock);
  REQUIRE(location.found);
  REQUIRE(location.range.begin == 2U);
  REQUIRE(location.range.end == 5U);
}

TEST_CASE("Badge block stops at the first non-badge line", "[locator][badges]") {
  const std::string doc = std::string(kVersionBadge) + "\nIntro\n" + kStatusBadge + "\n";
  const auto location = Locate(doc, FragmentKind::kBadgeBlock);
  REQUIRE(location.found);
  REQUIRE(location.range.begin == 0U);
  REQUIRE(location.range.end == 1U);
}

TEST_CASE("Missing badge block anchors after the top heading", "[locator][badges]") {
  const auto location = Locate("Intro\n## Sub\n# Title\nBody\n", FragmentKind::kBadgeBlock);
  REQUIRE_FALSE(location.found);
  REQUIRE(location.anchor.kind == AnchorKind::kAfterTopHeading);
  REQUIRE(location.anchor.line == 3U);
}

TEST_CASE("Missing badge block without heading anchors at start", "[locator][badges]") {
  const auto location = Locate("## Only a subheading\n", FragmentKind::kBadgeBlock);
  REQUIRE_FALSE(location.found);
  REQUIRE(location.anchor.kind == AnchorKind::kStartOfDocument);
  REQUIRE(location.anchor.line == 0U);
}

TEST_CASE("Install heading at any level is found", "[locator][install]") {
  const std::string doc = "# Title\n\n### Quick Setup\n\nSteps.\n\n## Usage\n";
  const auto location = Locate(doc, FragmentKind::kInstallSection);
  REQUIRE(location.found);
  REQUIRE(location.range.begin == 2U);
  REQUIRE(location.range.end == 6U);
}

TEST_CASE("Install words in prose are not a section", "[locator][install]") {
  const std::string doc = "# Title\n\nTo install, copy the folder.\n\n## Reinstalling\n\n## License\n";
  const auto location = Locate(doc, FragmentKind::kInstallSection);
  REQUIRE_FALSE(location.found);
  REQUIRE(location.anchor.kind == AnchorKind::kBeforeKnownSection);
  REQUIRE(location.anchor.line == 6U);
}

TEST_CASE("Known sections anchor by document order", "[locator][install]") {
  const std::string doc = "# Title\n\n## features\n\n## Usage\n";
  const auto location = Locate(doc, FragmentKind::kInstallSection);
  REQUIRE(location.anchor.kind == AnchorKind::kBeforeKnownSection);
  REQUIRE(location.anchor.line == 2U);
}

TEST_CASE("Known section names must be the whole heading", "[locator][install]") {
  const std::string doc = "# Title\n\n## Usage examples\n";
  const auto location = Locate(doc, FragmentKind::kInstallSection);
  REQUIRE_FALSE(location.found);
  REQUIRE(location.anchor.kind == AnchorKind::kEndOfDocument);
  REQUIRE(location.anchor.line == 3U);
}
