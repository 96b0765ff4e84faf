#include "diff/line_matcher.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace packdoc::diff {

namespace {

// Suffix LCS lengths over the trimmed middle, row-major (rows + 1) x (cols + 1).
std::vector<std::uint32_t> BuildLcsTable(const std::vector<std::string_view>& a,
                                         const std::vector<std::string_view>& b,
                                         std::size_t a_begin, std::size_t a_end,
                                         std::size_t b_begin, std::size_t b_end) {
  const std::size_t rows = a_end - a_begin;
  const std::size_t cols = b_end - b_begin;
  const std::size_t stride = cols + 1;
  std::vector<std::uint32_t> table((rows + 1) * stride, 0U);

  for (std::size_t i = rows; i-- > 0;) {
    for (std::size_t j = cols; j-- > 0;) {
      std::uint32_t& cell = table[i * stride + j];
      if (a[a_begin + i] == b[b_begin + j]) {
        cell = table[(i + 1) * stride + (j + 1)] + 1U;
      } else {
        cell = std::max(table[(i + 1) * stride + j], table[i * stride + (j + 1)]);
      }
    }
  }
  return table;
}

// Moves deletions ahead of insertions inside every maximal change run.
void OrderChangeRuns(std::vector<OpKind>& kinds) {
  std::size_t i = 0;
  while (i < kinds.size()) {
    if (kinds[i] == OpKind::kEqual) {
      ++i;
      continue;
    }
    std::size_t run_end = i;
    while (run_end < kinds.size() && kinds[run_end] != OpKind::kEqual) {
      ++run_end;
    }
    std::stable_partition(kinds.begin() + static_cast<std::ptrdiff_t>(i),
                          kinds.begin() + static_cast<std::ptrdiff_t>(run_end),
                          [](OpKind kind) { return kind == OpKind::kDelete; });
    i = run_end;
  }
}

} // namespace

std::vector<LineOp> MatchLines(const std::vector<std::string_view>& old_lines,
                               const std::vector<std::string_view>& new_lines) {
  // Common prefix and suffix never need the quadratic table.
  std::size_t prefix = 0;
  while (prefix < old_lines.size() && prefix < new_lines.size() &&
         old_lines[prefix] == new_lines[prefix]) {
    ++prefix;
  }
  std::size_t suffix = 0;
  while (suffix < old_lines.size() - prefix && suffix < new_lines.size() - prefix &&
         old_lines[old_lines.size() - 1 - suffix] == new_lines[new_lines.size() - 1 - suffix]) {
    ++suffix;
  }

  const std::size_t a_end = old_lines.size() - suffix;
  const std::size_t b_end = new_lines.size() - suffix;

  std::vector<OpKind> kinds(prefix, OpKind::kEqual);
  kinds.reserve(old_lines.size() + new_lines.size());

  const std::vector<std::uint32_t> table =
      BuildLcsTable(old_lines, new_lines, prefix, a_end, prefix, b_end);
  const std::size_t stride = b_end - prefix + 1;

  std::size_t i = 0;
  std::size_t j = 0;
  const std::size_t rows = a_end - prefix;
  const std::size_t cols = b_end - prefix;
  while (i < rows || j < cols) {
    if (i < rows && j < cols && old_lines[prefix + i] == new_lines[prefix + j]) {
      kinds.push_back(OpKind::kEqual);
      ++i;
      ++j;
    } else if (j == cols || (i < rows && table[(i + 1) * stride + j] >= table[i * stride + j + 1])) {
      kinds.push_back(OpKind::kDelete);
      ++i;
    } else {
      kinds.push_back(OpKind::kInsert);
      ++j;
    }
  }
  kinds.insert(kinds.end(), suffix, OpKind::kEqual);

  OrderChangeRuns(kinds);

  std::vector<LineOp> ops;
  ops.reserve(kinds.size());
  std::size_t old_index = 0;
  std::size_t new_index = 0;
  for (const OpKind kind : kinds) {
    ops.push_back(LineOp{kind, old_index, new_index});
    if (kind != OpKind::kInsert) {
      ++old_index;
    }
    if (kind != OpKind::kDelete) {
      ++new_index;
    }
  }
  return ops;
}

} // namespace packdoc::diff
