#include "report/change_reporter.hpp"

#include "diff/unified_diff.hpp"
#include "report/diff_render.hpp"

namespace packdoc::report {

const char* ToString(ChangeKind kind) {
  switch (kind) {
  case ChangeKind::kNoChange:
    return "no_change";
  case ChangeKind::kCreated:
    return "created";
  case ChangeKind::kModified:
    return "modified";
  }
  return "no_change";
}

ChangeRecord ClassifyAndReport(const std::optional<std::string>& old_text,
                               std::string_view new_text, std::string_view label, RunMode mode) {
  ChangeRecord record;
  record.mode = mode;
  record.label = std::string(label);

  const std::string_view before =
      old_text.has_value() ? std::string_view(*old_text) : std::string_view{};
  const diff::DiffResult result = diff::Diff(before, new_text, label);
  record.diff = result.unified;

  if (before.empty() && !new_text.empty()) {
    record.kind = ChangeKind::kCreated;
  } else if (result.changed) {
    record.kind = ChangeKind::kModified;
  } else {
    record.kind = ChangeKind::kNoChange;
  }
  return record;
}

std::string FormatChangeReport(const ChangeRecord& record, const Palette& palette,
                               std::optional<std::size_t> max_diff_lines) {
  const bool dry_run = record.mode == RunMode::kDryRun;
  std::string out;

  switch (record.kind) {
  case ChangeKind::kNoChange:
    return palette.Paint(palette.dim, record.label + ": no changes") + "\n";
  case ChangeKind::kCreated:
    out = palette.Paint(palette.green, record.label + ": created");
    if (dry_run) {
      out += " " + palette.Paint(palette.dim, "(dry run)");
    }
    break;
  case ChangeKind::kModified:
    out = record.label + ":";
    if (dry_run) {
      out += " " + palette.Paint(palette.dim, "(dry run)");
    }
    break;
  }

  out.push_back('\n');
  out += FormatDiffOutput(record.diff, palette, max_diff_lines);
  return out;
}

std::string FormatSkipped(std::string_view label, std::string_view reason,
                          const Palette& palette) {
  return std::string(label) + ": " +
         palette.Paint(palette.dim, "(skipped - " + std::string(reason) + ")") + "\n";
}

} // namespace packdoc::report
