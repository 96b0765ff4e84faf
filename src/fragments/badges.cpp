#include "fragments/badges.hpp"

#include <algorithm>
#include <sstream>

namespace packdoc::fragments {

namespace {

// Shields encodes " | " between platforms.
constexpr std::string_view kPlatformSeparator = "%20%7C%20";
constexpr std::size_t kDisplayRuleWidth = 60;

std::string BuildBadge(std::string_view label, std::string_view badge_path) {
  std::string badge = "![";
  badge += label;
  badge += "](";
  badge += kBadgeUrlPrefix;
  badge += badge_path;
  badge += ')';
  return badge;
}

// Keeps a badge marker on one parseable line: the URL ends at the first ')'
// and must not contain line breaks. '%' is escaped so encoded text stays
// unambiguous.
std::string EncodeBadgeText(std::string_view raw) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string encoded;
  encoded.reserve(raw.size());
  for (const char c : raw) {
    const auto byte = static_cast<unsigned char>(c);
    if (byte < 0x20U || byte == 0x7FU || c == ' ' || c == '%' || c == '(' || c == ')') {
      encoded.push_back('%');
      encoded.push_back(kHex[byte >> 4U]);
      encoded.push_back(kHex[byte & 0x0FU]);
      continue;
    }
    encoded.push_back(c);
  }
  return encoded;
}

} // namespace

bool IsBadgeLabel(std::string_view label) {
  return std::find(kBadgeLabels.begin(), kBadgeLabels.end(), label) != kBadgeLabels.end();
}

std::string_view StatusColor(std::string_view status) {
  switch (manifest::ClassifyStatus(status)) {
  case manifest::StatusKind::kStable:
    return "green";
  case manifest::StatusKind::kPreview:
  case manifest::StatusKind::kExperimental:
    return "orange";
  case manifest::StatusKind::kPrototype:
  case manifest::StatusKind::kDeprecated:
    return "red";
  case manifest::StatusKind::kReference:
    return "blue";
  case manifest::StatusKind::kArchived:
  case manifest::StatusKind::kUnknown:
    return "lightgrey";
  }
  return "lightgrey";
}

std::vector<std::string> BuildBadgeLines(const manifest::Manifest& manifest) {
  std::vector<std::string> lines;

  lines.push_back(BuildBadge("Version", "version-" + EncodeBadgeText(manifest.version) + "-blue"));

  const std::string status = manifest.status.empty() ? "unknown" : manifest.status;
  lines.push_back(
      BuildBadge("Status", "status-" + EncodeBadgeText(status) + "-" +
                               std::string(StatusColor(status))));

  if (!manifest.platforms.empty()) {
    std::string joined;
    for (std::size_t i = 0; i < manifest.platforms.size(); ++i) {
      if (i > 0U) {
        joined += kPlatformSeparator;
      }
      joined += EncodeBadgeText(manifest.platforms[i]);
    }
    lines.push_back(BuildBadge("Platform", "platform-" + joined + "-lightgrey"));
  }

  if (manifest.requires_talon_beta) {
    lines.push_back(BuildBadge("Talon Beta", "talon%20beta-required-red"));
  }

  return lines;
}

Fragment BuildBadgeFragment(const manifest::Manifest& manifest) {
  Fragment fragment;
  fragment.kind = FragmentKind::kBadgeBlock;
  const std::vector<std::string> lines = BuildBadgeLines(manifest);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0U) {
      fragment.text.push_back('\n');
    }
    fragment.text += lines[i];
  }
  return fragment;
}

std::string FormatBadgeDisplayBlock(const std::vector<std::string>& badge_lines) {
  const std::string rule(kDisplayRuleWidth, '=');
  std::ostringstream out;
  out << '\n' << rule << '\n'
      << "Shield Badges (copy to README.md)\n"
      << rule << '\n';
  for (const auto& line : badge_lines) {
    out << line << '\n';
  }
  out << rule << "\n\n";
  return out.str();
}

} // namespace packdoc::fragments
