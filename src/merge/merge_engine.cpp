#include "merge/merge_engine.hpp"

#include "document/lines.hpp"
#include "document/section_locator.hpp"
#include "fragments/badges.hpp"
#include "fragments/install_block.hpp"

#include <cstddef>
#include <utility>

namespace packdoc::merge {

namespace {

using document::Line;

constexpr std::string_view kDefaultTitle = "Talon Package";
constexpr std::string_view kDefaultDescription = "A Talon voice control package.";
constexpr std::string_view kPreviewImageLine = "<img src=\"preview.png\" alt=\"preview\">";

// Fragment text split into bare lines; terminators are chosen by the caller.
std::vector<std::string_view> FragmentLines(std::string_view text) {
  std::vector<std::string_view> out;
  for (const Line& line : document::SplitLines(text)) {
    out.push_back(line.text);
  }
  return out;
}

class Writer {
public:
  explicit Writer(std::string_view eol) : eol_(eol) {}

  // Copies a document line as-is.
  void Keep(const Line& line) {
    text_ += line.text;
    text_ += line.ending;
  }

  // Copies a document line, adding a terminator if it had none.
  void KeepTerminated(const Line& line) {
    text_ += line.text;
    text_ += line.ending.empty() ? eol_ : line.ending;
  }

  void Emit(std::string_view text) {
    text_ += text;
    text_ += eol_;
  }

  void EmitBlank() {
    text_ += eol_;
  }

  void EmitAll(const std::vector<std::string_view>& lines) {
    for (const std::string_view line : lines) {
      Emit(line);
    }
  }

  std::string Take() {
    return std::move(text_);
  }

private:
  std::string_view eol_;
  std::string text_;
};

std::string ReplaceRange(const std::vector<Line>& lines, const document::LineRange& range,
                         const std::vector<std::string_view>& replacement, std::string_view eol) {
  Writer out(eol);
  for (std::size_t i = 0; i < range.begin; ++i) {
    out.Keep(lines[i]);
  }

  // The last replacement line inherits the terminator of the old block end.
  for (std::size_t i = 0; i < replacement.size(); ++i) {
    if (i + 1 < replacement.size()) {
      out.Emit(replacement[i]);
      continue;
    }
    out.Keep(Line{replacement[i], lines[range.end - 1].ending});
  }

  for (std::size_t i = range.end; i < lines.size(); ++i) {
    out.Keep(lines[i]);
  }
  return out.Take();
}

std::string InsertBadgeBlock(const std::vector<Line>& lines, const document::Anchor& anchor,
                             const std::vector<std::string_view>& block, std::string_view eol) {
  Writer out(eol);

  if (anchor.kind == document::AnchorKind::kStartOfDocument) {
    out.EmitAll(block);
    if (!lines.empty() && !document::IsBlank(lines.front().text)) {
      out.EmitBlank();
    }
    for (const Line& line : lines) {
      out.Keep(line);
    }
    return out.Take();
  }

  // After the top heading. An existing blank line right below the heading
  // serves as the leading separator.
  std::size_t split = anchor.line;
  const bool reuse_blank = split < lines.size() && document::IsBlank(lines[split].text);
  if (reuse_blank) {
    ++split;
  }

  for (std::size_t i = 0; i < split; ++i) {
    out.KeepTerminated(lines[i]);
  }
  if (!reuse_blank) {
    out.EmitBlank();
  }
  out.EmitAll(block);
  if (split < lines.size()) {
    out.EmitBlank();
  }
  for (std::size_t i = split; i < lines.size(); ++i) {
    out.Keep(lines[i]);
  }
  return out.Take();
}

std::string InsertInstallSection(const std::vector<Line>& lines, const document::Anchor& anchor,
                                 const std::vector<std::string_view>& section,
                                 std::string_view eol) {
  Writer out(eol);

  if (anchor.kind == document::AnchorKind::kBeforeKnownSection) {
    for (std::size_t i = 0; i < anchor.line; ++i) {
      out.Keep(lines[i]);
    }
    if (anchor.line > 0 && !document::IsBlank(lines[anchor.line - 1].text)) {
      out.EmitBlank();
    }
    out.EmitAll(section);
    out.EmitBlank();
    for (std::size_t i = anchor.line; i < lines.size(); ++i) {
      out.Keep(lines[i]);
    }
    return out.Take();
  }

  // No known section to sit in front of: append.
  for (const Line& line : lines) {
    out.KeepTerminated(line);
  }
  if (!lines.empty() && !document::IsBlank(lines.back().text)) {
    out.EmitBlank();
  }
  out.EmitAll(section);
  return out.Take();
}

std::string DescribePass(const fragments::Fragment& fragment, const MergeResult& result) {
  std::string description =
      std::string(fragments::ToString(fragment.kind)) + ": " + ToString(result.action);
  if (result.anchor.has_value()) {
    description += " at ";
    description += document::ToString(*result.anchor);
  }
  return description;
}

} // namespace

const char* ToString(MergeAction action) {
  switch (action) {
  case MergeAction::kReplacedExisting:
    return "replaced existing";
  case MergeAction::kInserted:
    return "inserted";
  case MergeAction::kKeptExisting:
    return "kept existing";
  case MergeAction::kNotApplicable:
    return "not applicable";
  }
  return "kept existing";
}

MergeResult Merge(std::string_view document, const fragments::Fragment& fragment) {
  const std::vector<Line> lines = document::SplitLines(document);
  const std::string_view eol = document::DetectLineEnding(document);
  const document::Location location = document::Locate(lines, fragment.kind);
  const std::vector<std::string_view> fragment_lines = FragmentLines(fragment.text);

  MergeResult result;
  if (fragment.kind == fragments::FragmentKind::kBadgeBlock) {
    if (fragment_lines.empty()) {
      result.text = std::string(document);
      result.action = MergeAction::kNotApplicable;
      return result;
    }
    if (location.found) {
      result.text = ReplaceRange(lines, location.range, fragment_lines, eol);
      result.action = MergeAction::kReplacedExisting;
      return result;
    }
    result.text = InsertBadgeBlock(lines, location.anchor, fragment_lines, eol);
    result.action = MergeAction::kInserted;
    result.anchor = location.anchor.kind;
    return result;
  }

  if (location.found) {
    result.text = std::string(document);
    result.action = MergeAction::kKeptExisting;
    return result;
  }
  if (!fragment.applicable || fragment_lines.empty()) {
    result.text = std::string(document);
    result.action = MergeAction::kNotApplicable;
    return result;
  }
  result.text = InsertInstallSection(lines, location.anchor, fragment_lines, eol);
  result.action = MergeAction::kInserted;
  result.anchor = location.anchor.kind;
  return result;
}

std::string MergeAll(std::string_view document, const manifest::Manifest& manifest,
                     const Stages& stages, std::vector<std::string>* actions) {
  std::string text(document);

  if (stages.badges) {
    const fragments::Fragment badges = fragments::BuildBadgeFragment(manifest);
    MergeResult result = Merge(text, badges);
    if (actions != nullptr) {
      actions->push_back(DescribePass(badges, result));
    }
    text = std::move(result.text);
  }

  if (stages.install) {
    const fragments::Fragment install = fragments::BuildInstallFragment(manifest);
    MergeResult result = Merge(text, install);
    if (actions != nullptr) {
      actions->push_back(DescribePass(install, result));
    }
    text = std::move(result.text);
  }

  return text;
}

std::string ComposeNewDocument(const manifest::Manifest& manifest, const Stages& stages,
                               bool has_preview_image) {
  std::string title(kDefaultTitle);
  if (manifest.title.has_value()) {
    title = *manifest.title;
  } else if (manifest.name.has_value()) {
    title = *manifest.name;
  }

  std::string text = "# " + title + "\n\n";

  if (stages.badges) {
    text += fragments::BuildBadgeFragment(manifest).text;
    text += "\n\n";
  }

  text += manifest.description.has_value() ? *manifest.description
                                            : std::string(kDefaultDescription);
  text += '\n';

  if (has_preview_image) {
    text += '\n';
    text += kPreviewImageLine;
    text += '\n';
  }

  if (stages.install) {
    const fragments::Fragment install = fragments::BuildInstallFragment(manifest);
    if (install.applicable) {
      text += '\n';
      text += install.text;
      text += '\n';
    }
  }

  return text;
}

std::string UpdateDocument(const std::optional<std::string>& current,
                           const manifest::Manifest& manifest, const Stages& stages,
                           bool has_preview_image, std::vector<std::string>* actions) {
  if (!current.has_value() || current->empty()) {
    if (actions != nullptr) {
      actions->push_back("composed new document");
    }
    return ComposeNewDocument(manifest, stages, has_preview_image);
  }
  return MergeAll(*current, manifest, stages, actions);
}

} // namespace packdoc::merge
