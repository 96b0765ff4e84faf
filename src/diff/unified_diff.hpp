#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace packdoc::diff {

constexpr std::size_t kDefaultContextLines = 3;

enum class ContentType {
  kText,
  kJson,
};

struct DiffResult {
  bool changed = false;
  // Unified diff text, every line newline-terminated. Empty when unchanged.
  std::string unified;
};

// `.json` labels are compared structurally, everything else as text.
ContentType DetectContentType(std::string_view label);

// Line diff of two texts.
//
// Contract:
// - byte-equal inputs return {false, ""} without running the matcher.
// - headers are `--- a/<label>` / `+++ b/<label>`, hunks `@@ -l,s +l,s @@`
//   with `context_lines` of surrounding context.
// - a final line without terminator is followed by
//   `\ No newline at end of file`.
DiffResult DiffText(std::string_view old_text, std::string_view new_text, std::string_view label,
                    std::size_t context_lines = kDefaultContextLines);

// Like DiffText, but both sides are first re-rendered with two-space
// indentation in authored key order. If either side fails to parse, the raw
// texts are diffed instead.
DiffResult DiffJson(std::string_view old_text, std::string_view new_text, std::string_view label,
                    std::size_t context_lines = kDefaultContextLines);

DiffResult Diff(std::string_view old_text, std::string_view new_text, std::string_view label,
                std::size_t context_lines = kDefaultContextLines);

} // namespace packdoc::diff
