#pragma once

#include "report/palette.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace packdoc::report {

// Colors a unified diff by line prefix: the two file header lines dim,
// `+` green, `-` red, `@@` cyan.
std::string ColorizeDiff(std::string_view unified, const Palette& palette);

// Colorized diff, cut after `max_lines` lines when set, with a trailing
// `... (N more lines)` note. Without `max_lines` nothing is dropped.
std::string FormatDiffOutput(std::string_view unified, const Palette& palette,
                             std::optional<std::size_t> max_lines = std::nullopt);

} // namespace packdoc::report
