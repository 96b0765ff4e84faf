#pragma once

#include "document/lines.hpp"
#include "fragments/fragment.hpp"

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

namespace packdoc::document {

// Words that mark an existing install section when found in any heading.
constexpr std::array<std::string_view, 3> kInstallHeadingWords = {"Installation", "Install",
                                                                  "Setup"};

// An install section is inserted before the first of these headings.
constexpr std::array<std::string_view, 5> kKnownSectionNames = {"Usage", "Features", "License",
                                                                "Contributing", "API"};

enum class AnchorKind {
  kAfterTopHeading,
  kStartOfDocument,
  kBeforeKnownSection,
  kEndOfDocument,
};

const char* ToString(AnchorKind kind);

// Insertion point for an absent fragment. New lines go before `line`, so
// `line == lines.size()` means append.
struct Anchor {
  AnchorKind kind = AnchorKind::kEndOfDocument;
  std::size_t line = 0;
};

// Half-open line index range [begin, end).
struct LineRange {
  std::size_t begin = 0;
  std::size_t end = 0;
};

// Either `found` with the existing `range`, or not found with an `anchor`.
struct Location {
  bool found = false;
  LineRange range;
  Anchor anchor;
};

// Badge block: first maximal run of badge lines, blank lines allowed between
// them. Trailing blank lines are not part of the block.
// Install section: from the first heading naming install/installation/setup
// up to the next heading of the same or higher level.
Location Locate(const std::vector<Line>& lines, fragments::FragmentKind kind);

Location Locate(std::string_view document, fragments::FragmentKind kind);

} // namespace packdoc::document
