#include "document/section_locator.hpp"

#include <optional>

namespace packdoc::document {

namespace {

std::optional<LineRange> FindBadgeBlock(const std::vector<Line>& lines) {
  std::size_t index = 0;
  while (index < lines.size() && !IsBadgeLine(lines[index].text)) {
    ++index;
  }
  if (index == lines.size()) {
    return std::nullopt;
  }

  LineRange range{index, index + 1};
  for (std::size_t i = index + 1; i < lines.size(); ++i) {
    if (IsBadgeLine(lines[i].text)) {
      range.end = i + 1;
      continue;
    }
    if (!IsBlank(lines[i].text)) {
      break;
    }
  }
  return range;
}

bool IsInstallHeading(const Heading& heading) {
  for (const std::string_view word : kInstallHeadingWords) {
    if (ContainsWholeWord(heading.text, word)) {
      return true;
    }
  }
  return false;
}

bool IsKnownSectionHeading(const Heading& heading) {
  for (const std::string_view name : kKnownSectionNames) {
    if (EqualsIgnoreCase(heading.text, name)) {
      return true;
    }
  }
  return false;
}

Location LocateBadgeBlock(const std::vector<Line>& lines) {
  Location location;
  if (const auto range = FindBadgeBlock(lines); range.has_value()) {
    location.found = true;
    location.range = *range;
    return location;
  }

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto heading = ParseHeading(lines[i].text);
    if (heading.has_value() && heading->level == 1 && !heading->text.empty()) {
      location.anchor = Anchor{AnchorKind::kAfterTopHeading, i + 1};
      return location;
    }
  }

  location.anchor = Anchor{AnchorKind::kStartOfDocument, 0};
  return location;
}

Location LocateInstallSection(const std::vector<Line>& lines) {
  Location location;
  std::optional<std::size_t> known_section;

  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto heading = ParseHeading(lines[i].text);
    if (!heading.has_value()) {
      continue;
    }

    if (IsInstallHeading(*heading)) {
      location.found = true;
      location.range = LineRange{i, lines.size()};
      for (std::size_t j = i + 1; j < lines.size(); ++j) {
        const auto next = ParseHeading(lines[j].text);
        if (next.has_value() && next->level <= heading->level) {
          location.range.end = j;
          break;
        }
      }
      return location;
    }

    if (!known_section.has_value() && IsKnownSectionHeading(*heading)) {
      known_section = i;
    }
  }

  if (known_section.has_value()) {
    location.anchor = Anchor{AnchorKind::kBeforeKnownSection, *known_section};
  } else {
    location.anchor = Anchor{AnchorKind::kEndOfDocument, lines.size()};
  }
  return location;
}

} // namespace

const char* ToString(AnchorKind kind) {
  switch (kind) {
  case AnchorKind::kAfterTopHeading:
    return "after_top_heading";
  case AnchorKind::kStartOfDocument:
    return "start_of_document";
  case AnchorKind::kBeforeKnownSection:
    return "before_known_section";
  case AnchorKind::kEndOfDocument:
    return "end_of_document";
  }
  return "end_of_document";
}

Location Locate(const std::vector<Line>& lines, fragments::FragmentKind kind) {
  switch (kind) {
  case fragments::FragmentKind::kBadgeBlock:
    return LocateBadgeBlock(lines);
  case fragments::FragmentKind::kInstallSection:
    return LocateInstallSection(lines);
  }
  return Location{};
}

Location Locate(std::string_view document, fragments::FragmentKind kind) {
  return Locate(SplitLines(document), kind);
}

} // namespace packdoc::document
