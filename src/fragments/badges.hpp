#pragma once

#include "fragments/fragment.hpp"
#include "manifest/manifest.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace packdoc::fragments {

constexpr std::string_view kBadgeUrlPrefix = "https://img.shields.io/badge/";

// Labels recognized as one contiguous badge block, in render order.
constexpr std::array<std::string_view, 5> kBadgeLabels = {
    "Version", "Status", "Platform", "License", "Talon Beta",
};

bool IsBadgeLabel(std::string_view label);

// Unknown statuses render lightgrey.
std::string_view StatusColor(std::string_view status);

// Badge lines in fixed order: version, status, platform (only with declared
// platforms), talon beta (only when required).
std::vector<std::string> BuildBadgeLines(const manifest::Manifest& manifest);

Fragment BuildBadgeFragment(const manifest::Manifest& manifest);

// Framed copy-paste block printed by `packdoc shields`.
std::string FormatBadgeDisplayBlock(const std::vector<std::string>& badge_lines);

} // namespace packdoc::fragments
