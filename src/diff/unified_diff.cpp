#include "diff/unified_diff.hpp"

#include "core/json_dom.hpp"
#include "core/json_format.hpp"
#include "diff/line_matcher.hpp"
#include "document/lines.hpp"

#include <algorithm>
#include <vector>

namespace packdoc::diff {

namespace {

constexpr std::string_view kNoNewlineMarker = "\\ No newline at end of file\n";

struct Hunk {
  std::size_t begin = 0;
  std::size_t end = 0;
};

// Whole physical lines (text plus terminator) as views into `text`.
std::vector<std::string_view> PhysicalLines(std::string_view text) {
  std::vector<std::string_view> lines;
  for (const document::Line& line : document::SplitLines(text)) {
    lines.emplace_back(line.text.data(), line.text.size() + line.ending.size());
  }
  return lines;
}

// Groups changes whose separating equal run is at most 2 * context lines.
std::vector<Hunk> GroupHunks(const std::vector<LineOp>& ops, std::size_t context) {
  std::vector<Hunk> hunks;
  std::size_t cursor = 0;
  while (cursor < ops.size()) {
    std::size_t first_change = cursor;
    while (first_change < ops.size() && ops[first_change].kind == OpKind::kEqual) {
      ++first_change;
    }
    if (first_change == ops.size()) {
      break;
    }

    std::size_t last_change_end = first_change;
    std::size_t scan = first_change;
    while (scan < ops.size()) {
      if (ops[scan].kind != OpKind::kEqual) {
        last_change_end = ++scan;
        continue;
      }
      std::size_t equal_end = scan;
      while (equal_end < ops.size() && ops[equal_end].kind == OpKind::kEqual) {
        ++equal_end;
      }
      if (equal_end == ops.size() || equal_end - scan > 2 * context) {
        break;
      }
      scan = equal_end;
    }

    Hunk hunk;
    hunk.begin = first_change > context ? first_change - context : 0;
    hunk.begin = std::max(hunk.begin, cursor);
    hunk.end = std::min(ops.size(), last_change_end + context);
    hunks.push_back(hunk);
    cursor = hunk.end;
  }
  return hunks;
}

// `start` is a 0-based line index; an empty range names the line before it.
std::string FormatRange(std::size_t start, std::size_t length) {
  std::size_t beginning = start + 1;
  if (length == 1) {
    return std::to_string(beginning);
  }
  if (length == 0) {
    --beginning;
  }
  return std::to_string(beginning) + "," + std::to_string(length);
}

void AppendLine(std::string& out, char prefix, std::string_view physical_line) {
  out.push_back(prefix);
  out += physical_line;
  if (physical_line.empty() || physical_line.back() != '\n') {
    out.push_back('\n');
    out += kNoNewlineMarker;
  }
}

std::string RenderUnified(const std::vector<std::string_view>& old_lines,
                          const std::vector<std::string_view>& new_lines, std::string_view label,
                          std::size_t context) {
  const std::vector<LineOp> ops = MatchLines(old_lines, new_lines);
  const std::vector<Hunk> hunks = GroupHunks(ops, context);
  if (hunks.empty()) {
    return "";
  }

  std::string out;
  out += "--- a/";
  out += label;
  out += "\n+++ b/";
  out += label;
  out += '\n';

  for (const Hunk& hunk : hunks) {
    std::size_t old_length = 0;
    std::size_t new_length = 0;
    for (std::size_t i = hunk.begin; i < hunk.end; ++i) {
      if (ops[i].kind != OpKind::kInsert) {
        ++old_length;
      }
      if (ops[i].kind != OpKind::kDelete) {
        ++new_length;
      }
    }

    out += "@@ -" + FormatRange(ops[hunk.begin].old_index, old_length) + " +" +
           FormatRange(ops[hunk.begin].new_index, new_length) + " @@\n";

    for (std::size_t i = hunk.begin; i < hunk.end; ++i) {
      const LineOp& op = ops[i];
      switch (op.kind) {
      case OpKind::kEqual:
        AppendLine(out, ' ', old_lines[op.old_index]);
        break;
      case OpKind::kDelete:
        AppendLine(out, '-', old_lines[op.old_index]);
        break;
      case OpKind::kInsert:
        AppendLine(out, '+', new_lines[op.new_index]);
        break;
      }
    }
  }
  return out;
}

bool NormalizeJson(std::string_view text, std::string& normalized) {
  core::json::Value root;
  std::string error;
  if (!core::json::Parse(text, root, error)) {
    return false;
  }
  normalized = core::json::FormatIndented(root, 2);
  normalized.push_back('\n');
  return true;
}

} // namespace

ContentType DetectContentType(std::string_view label) {
  constexpr std::string_view kJsonSuffix = ".json";
  if (label.size() >= kJsonSuffix.size() &&
      document::EqualsIgnoreCase(label.substr(label.size() - kJsonSuffix.size()), kJsonSuffix)) {
    return ContentType::kJson;
  }
  return ContentType::kText;
}

DiffResult DiffText(std::string_view old_text, std::string_view new_text, std::string_view label,
                    std::size_t context_lines) {
  DiffResult result;
  if (old_text == new_text) {
    return result;
  }

  result.unified =
      RenderUnified(PhysicalLines(old_text), PhysicalLines(new_text), label, context_lines);
  result.changed = !result.unified.empty();
  return result;
}

DiffResult DiffJson(std::string_view old_text, std::string_view new_text, std::string_view label,
                    std::size_t context_lines) {
  if (old_text == new_text) {
    return DiffResult{};
  }

  std::string old_normalized;
  std::string new_normalized;
  if (!NormalizeJson(old_text, old_normalized) || !NormalizeJson(new_text, new_normalized)) {
    return DiffText(old_text, new_text, label, context_lines);
  }
  return DiffText(old_normalized, new_normalized, label, context_lines);
}

DiffResult Diff(std::string_view old_text, std::string_view new_text, std::string_view label,
                std::size_t context_lines) {
  if (DetectContentType(label) == ContentType::kJson) {
    return DiffJson(old_text, new_text, label, context_lines);
  }
  return DiffText(old_text, new_text, label, context_lines);
}

} // namespace packdoc::diff
