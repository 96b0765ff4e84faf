#include "diff/line_matcher.hpp"
#include "diff/unified_diff.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

using packdoc::diff::ContentType;
using packdoc::diff::DetectContentType;
using packdoc::diff::Diff;
using packdoc::diff::DiffText;
using packdoc::diff::OpKind;

TEST_CASE("Identical inputs produce no diff", "[diff]") {
  const auto result = DiffText("a\nb\n", "a\nb\n", "README.md");
  REQUIRE_FALSE(result.changed);
  REQUIRE(result.unified.empty());
}

TEST_CASE("Single line replacement", "[diff]") {
  const auto result = DiffText("a\nb\nc\n", "a\nB\nc\n", "f.txt");
  REQUIRE(result.changed);
  REQUIRE(result.unified == "--- a/f.txt\n+++ b/f.txt\n@@ -1,3 +1,3 @@\n a\n-b\n+B\n c\n");
}

TEST_CASE("Zero context keeps only changed lines", "[diff]") {
  const auto result = DiffText("a\nb\nc\n", "a\nB\nc\n", "f.txt", 0);
  REQUIRE(result.unified == "--- a/f.txt\n+++ b/f.txt\n@@ -2 +2 @@\n-b\n+B\n");
}

TEST_CASE("Diff against empty text is all additions", "[diff]") {
  const auto result = DiffText("", "x\ny\n", "README.md");
  REQUIRE(result.unified == "--- a/README.md\n+++ b/README.md\n@@ -0,0 +1,2 @@\n+x\n+y\n");
}

TEST_CASE("Missing final newline is marked", "[diff]") {
  const auto result = DiffText("a\n", "a\nb", "f.txt");
  REQUIRE(result.unified ==
          "--- a/f.txt\n+++ b/f.txt\n@@ -1 +1,2 @@\n a\n+b\n\\ No newline at end of file\n");

  // Adding the terminator is itself a change.
  const auto terminated = DiffText("a\nb", "a\nb\n", "f.txt");
  REQUIRE(terminated.changed);
  REQUIRE(terminated.unified.find("-b\n\\ No newline at end of file\n+b\n") != std::string::npos);
}

TEST_CASE("Deletions precede insertions inside a change run", "[diff]") {
  const auto result = DiffText("a\nb\nc\n", "x\ny\n", "f.txt");
  REQUIRE(result.unified == "--- a/f.txt\n+++ b/f.txt\n@@ -1,3 +1,2 @@\n-a\n-b\n-c\n+x\n+y\n");
}

TEST_CASE("Distant changes form separate hunks", "[diff]") {
  std::string old_text;
  std::string new_text;
  for (int i = 1; i <= 20; ++i) {
    const std::string line = "line" + std::to_string(i) + "\n";
    old_text += line;
    new_text += (i == 2 || i == 19) ? "changed" + std::to_string(i) + "\n" : line;
  }

  const auto result = DiffText(old_text, new_text, "f.txt");
  REQUIRE(result.unified.find("@@ -1,5 +1,5 @@\n") != std::string::npos);
  REQUIRE(result.unified.find("@@ -16,5 +16,5 @@\n") != std::string::npos);
  REQUIRE(result.unified.find("line10") == std::string::npos);
}

TEST_CASE("Nearby changes share one hunk", "[diff]") {
  const std::string old_text = "1\n2\n3\n4\n5\n6\n7\n8\n9\n10\n";
  const std::string new_text = "1\nTWO\n3\n4\n5\n6\n7\n8\nNINE\n10\n";
  const auto result = DiffText(old_text, new_text, "f.txt");
  REQUIRE(result.unified.find("@@ -1,10 +1,10 @@\n") != std::string::npos);
  const std::size_t first_hunk = result.unified.find("\n@@");
  REQUIRE(result.unified.find("\n@@", first_hunk + 1) == std::string::npos);
}

TEST_CASE("Line matcher reports consumed indices", "[diff][matcher]") {
  const std::vector<std::string_view> old_lines = {"a", "b", "c"};
  const std::vector<std::string_view> new_lines = {"a", "c", "d"};
  const auto ops = packdoc::diff::MatchLines(old_lines, new_lines);
  REQUIRE(ops.size() == 4U);
  REQUIRE(ops[0].kind == OpKind::kEqual);
  REQUIRE(ops[1].kind == OpKind::kDelete);
  REQUIRE(ops[1].old_index == 1U);
  REQUIRE(ops[2].kind == OpKind::kEqual);
  REQUIRE(ops[2].old_index == 2U);
  REQUIRE(ops[2].new_index == 1U);
  REQUIRE(ops[3].kind == OpKind::kInsert);
  REQUIRE(ops[3].new_index == 2U);
}

TEST_CASE("Content type follows the label suffix", "[diff][json]") {
  REQUIRE(DetectContentType("manifest.json") == ContentType::kJson);
  REQUIRE(DetectContentType("pkg/Manifest.JSON") == ContentType::kJson);
  REQUIRE(DetectContentType("README.md") == ContentType::kText);
  REQUIRE(DetectContentType("json") == ContentType::kText);
}

TEST_CASE("JSON formatting differences are not changes", "[diff][json]") {
  const auto result = Diff("{\"a\":1,\"b\":[true,null]}", "{ \"a\" : 1,\n  \"b\": [ true, null ] }",
                           "manifest.json");
  REQUIRE_FALSE(result.changed);
  REQUIRE(result.unified.empty());
}

TEST_CASE("JSON diff compares normalized values in authored order", "[diff][json]") {
  const auto result = Diff("{\"b\":1,\"a\":2}", "{\"b\":1,\"a\":3}", "manifest.json");
  REQUIRE(result.unified == "--- a/manifest.json\n+++ b/manifest.json\n"
                            "@@ -1,4 +1,4 @@\n {\n   \"b\": 1,\n-  \"a\": 2\n+  \"a\": 3\n }\n");
}

TEST_CASE("JSON number spelling is significant", "[diff][json]") {
  const auto result = Diff("{\"v\": 1.0}", "{\"v\": 1}", "manifest.json");
  REQUIRE(result.changed);
  REQUIRE(result.unified.find("-  \"v\": 1.0\n+  \"v\": 1\n") != std::string::npos);
}

TEST_CASE("Unparseable JSON falls back to a text diff", "[diff][json]") {
  const auto result = Diff("{bad\n", "{\"ok\": true}\n", "manifest.json");
  REQUIRE(result.changed);
  REQUIRE(result.unified.find("-{bad\n+{\"ok\": true}\n") != std::string::npos);
}
