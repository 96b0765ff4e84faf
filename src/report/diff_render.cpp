#include "report/diff_render.hpp"

#include <vector>

namespace packdoc::report {

namespace {

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

std::vector<std::string_view> SplitDiffLines(std::string_view unified) {
  std::vector<std::string_view> lines;
  std::size_t start = 0;
  while (start < unified.size()) {
    const std::size_t newline = unified.find('\n', start);
    if (newline == std::string_view::npos) {
      lines.push_back(unified.substr(start));
      break;
    }
    lines.push_back(unified.substr(start, newline - start));
    start = newline + 1;
  }
  return lines;
}

// File headers are only ever the first two lines; later `---`/`+++` lines
// are removed or added content.
bool IsFileHeader(std::size_t index, std::string_view line) {
  return (index == 0 && StartsWith(line, "--- ")) || (index == 1 && StartsWith(line, "+++ "));
}

std::string ColorizeLine(std::size_t index, std::string_view line, const Palette& palette) {
  if (IsFileHeader(index, line)) {
    return palette.Paint(palette.dim, line);
  }
  if (StartsWith(line, "+")) {
    return palette.Paint(palette.green, line);
  }
  if (StartsWith(line, "-")) {
    return palette.Paint(palette.red, line);
  }
  if (StartsWith(line, "@@")) {
    return palette.Paint(palette.cyan, line);
  }
  return std::string(line);
}

} // namespace

std::string ColorizeDiff(std::string_view unified, const Palette& palette) {
  const std::vector<std::string_view> lines = SplitDiffLines(unified);
  std::string out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    out += ColorizeLine(i, lines[i], palette);
    out.push_back('\n');
  }
  return out;
}

std::string FormatDiffOutput(std::string_view unified, const Palette& palette,
                             std::optional<std::size_t> max_lines) {
  const std::vector<std::string_view> lines = SplitDiffLines(unified);
  if (!max_lines.has_value() || lines.size() <= *max_lines) {
    return ColorizeDiff(unified, palette);
  }

  // Cut right after the last shown line's terminator.
  std::size_t cut = 0;
  for (std::size_t i = 0; i < *max_lines; ++i) {
    cut += lines[i].size() + 1;
  }
  std::string out = ColorizeDiff(unified.substr(0, cut), palette);
  out += palette.Paint(palette.dim,
                       "... (" + std::to_string(lines.size() - *max_lines) + " more lines)");
  out.push_back('\n');
  return out;
}

} // namespace packdoc::report
