#pragma once

#include <string>
#include <string_view>

namespace packdoc::fragments {

enum class FragmentKind {
  kBadgeBlock,
  kInstallSection,
};

inline const char* ToString(FragmentKind kind) {
  switch (kind) {
  case FragmentKind::kBadgeBlock:
    return "badge_block";
  case FragmentKind::kInstallSection:
    return "install_section";
  }
  return "badge_block";
}

// Desired text for one generated region of a document. Recomputed from the
// manifest on every run. `applicable == false` means current manifest state
// rules the region out, so an absent region stays absent.
struct Fragment {
  FragmentKind kind = FragmentKind::kBadgeBlock;
  std::string text;
  bool applicable = true;
};

} // namespace packdoc::fragments
