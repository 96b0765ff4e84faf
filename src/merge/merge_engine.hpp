#pragma once

#include "document/section_locator.hpp"
#include "fragments/fragment.hpp"
#include "manifest/manifest.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packdoc::merge {

enum class MergeAction {
  kReplacedExisting,
  kInserted,
  kKeptExisting,
  kNotApplicable,
};

const char* ToString(MergeAction action);

struct MergeResult {
  std::string text;
  MergeAction action = MergeAction::kKeptExisting;
  // Where the fragment went; set only for kInserted.
  std::optional<document::AnchorKind> anchor;
};

// Which fragment kinds a run regenerates.
struct Stages {
  bool badges = true;
  bool install = true;
};

// Splices one fragment into `document` and returns the new text.
//
// Contract:
// - badge block found: its line range is swapped for the fragment lines.
// - badge block absent: inserted at the locator anchor with blank separators.
// - install section found: document returned unchanged.
// - install section absent and fragment not applicable: unchanged.
// - install section absent otherwise: inserted at the anchor with a blank
//   line before and after.
// - lines outside the touched range keep their bytes, including terminators.
// Merging the result again with the same fragment returns it unchanged.
MergeResult Merge(std::string_view document, const fragments::Fragment& fragment);

// One merge pass per enabled stage (badges first). `actions` receives a short
// description per pass when non-null, e.g. "badge_block: inserted at
// after_top_heading".
std::string MergeAll(std::string_view document, const manifest::Manifest& manifest,
                     const Stages& stages, std::vector<std::string>* actions = nullptr);

// Full README for a package that has none yet. The output is a fixed point of
// MergeAll for the same manifest and stages.
std::string ComposeNewDocument(const manifest::Manifest& manifest, const Stages& stages,
                               bool has_preview_image);

// Composes when there is no current text (or it is empty), merges otherwise.
std::string UpdateDocument(const std::optional<std::string>& current,
                           const manifest::Manifest& manifest, const Stages& stages,
                           bool has_preview_image, std::vector<std::string>* actions = nullptr);

} // namespace packdoc::merge
