#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace packdoc::diff {

enum class OpKind {
  kEqual,
  kDelete,
  kInsert,
};

// One step of an edit script. `old_index` / `new_index` count the lines of
// each side consumed before this step, so an equal step pairs
// old[old_index] with new[new_index].
struct LineOp {
  OpKind kind = OpKind::kEqual;
  std::size_t old_index = 0;
  std::size_t new_index = 0;
};

// Longest-common-subsequence edit script. Within each run of changes all
// deletions come before insertions.
std::vector<LineOp> MatchLines(const std::vector<std::string_view>& old_lines,
                               const std::vector<std::string_view>& new_lines);

} // namespace packdoc::diff
