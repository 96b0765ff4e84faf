#include "document/lines.hpp"

#include "fragments/badges.hpp"

#include <cctype>
#include <cstdint>

namespace packdoc::document {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

bool IsWordByte(char c) {
  const auto byte = static_cast<unsigned char>(c);
  return byte >= 0x80U || std::isalnum(byte) != 0 || c == '_';
}

char LowerAscii(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Consumes one marker at the front of `text`; returns its length or 0.
std::size_t MatchBadgeMarker(std::string_view text) {
  if (text.substr(0, 2) != "![") {
    return 0;
  }
  const std::size_t label_end = text.find(']', 2);
  if (label_end == std::string_view::npos) {
    return 0;
  }
  if (!fragments::IsBadgeLabel(text.substr(2, label_end - 2))) {
    return 0;
  }
  if (label_end + 1 >= text.size() || text[label_end + 1] != '(') {
    return 0;
  }

  const std::size_t url_begin = label_end + 2;
  const std::string_view url_and_rest = text.substr(url_begin);
  if (url_and_rest.substr(0, fragments::kBadgeUrlPrefix.size()) != fragments::kBadgeUrlPrefix) {
    return 0;
  }
  const std::size_t close = text.find(')', url_begin);
  if (close == std::string_view::npos || close == url_begin + fragments::kBadgeUrlPrefix.size()) {
    return 0;
  }
  return close + 1;
}

} // namespace

std::vector<Line> SplitLines(std::string_view document) {
  std::vector<Line> lines;
  std::size_t start = 0;
  while (start < document.size()) {
    const std::size_t newline = document.find('\n', start);
    if (newline == std::string_view::npos) {
      lines.push_back(Line{document.substr(start), std::string_view{}});
      break;
    }

    std::size_t text_end = newline;
    if (text_end > start && document[text_end - 1] == '\r') {
      --text_end;
    }
    lines.push_back(Line{document.substr(start, text_end - start),
                         document.substr(text_end, newline + 1 - text_end)});
    start = newline + 1;
  }
  return lines;
}

std::string_view DetectLineEnding(std::string_view document) {
  const std::size_t newline = document.find('\n');
  if (newline != std::string_view::npos && newline > 0 && document[newline - 1] == '\r') {
    return "\r\n";
  }
  return "\n";
}

std::string_view TrimWhitespace(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size() && IsSpace(text[begin])) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && IsSpace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

bool IsBlank(std::string_view text) {
  return TrimWhitespace(text).empty();
}

std::optional<Heading> ParseHeading(std::string_view line_text) {
  std::size_t hashes = 0;
  while (hashes < line_text.size() && line_text[hashes] == '#') {
    ++hashes;
  }
  if (hashes == 0 || hashes > 6) {
    return std::nullopt;
  }
  if (hashes >= line_text.size() || !IsSpace(line_text[hashes])) {
    return std::nullopt;
  }

  Heading heading;
  heading.level = static_cast<int>(hashes);
  heading.text = TrimWhitespace(line_text.substr(hashes));
  return heading;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    if (LowerAscii(lhs[i]) != LowerAscii(rhs[i])) {
      return false;
    }
  }
  return true;
}

bool ContainsWholeWord(std::string_view text, std::string_view word) {
  if (word.empty() || word.size() > text.size()) {
    return false;
  }
  for (std::size_t pos = 0; pos + word.size() <= text.size(); ++pos) {
    if (!EqualsIgnoreCase(text.substr(pos, word.size()), word)) {
      continue;
    }
    const bool left_ok = pos == 0 || !IsWordByte(text[pos - 1]);
    const std::size_t after = pos + word.size();
    const bool right_ok = after == text.size() || !IsWordByte(text[after]);
    if (left_ok && right_ok) {
      return true;
    }
  }
  return false;
}

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t continuation = 0;
    std::uint32_t code_point = 0;
    if (lead < 0x80U) {
      ++i;
      continue;
    }
    if ((lead & 0xE0U) == 0xC0U) {
      continuation = 1;
      code_point = lead & 0x1FU;
    } else if ((lead & 0xF0U) == 0xE0U) {
      continuation = 2;
      code_point = lead & 0x0FU;
    } else if ((lead & 0xF8U) == 0xF0U) {
      continuation = 3;
      code_point = lead & 0x07U;
    } else {
      return false;
    }
    if (continuation >= text.size() - i) {
      return false;
    }
    for (std::size_t k = 1; k <= continuation; ++k) {
      const auto byte = static_cast<unsigned char>(text[i + k]);
      if ((byte & 0xC0U) != 0x80U) {
        return false;
      }
      code_point = (code_point << 6U) | (byte & 0x3FU);
    }
    // Reject overlong forms, surrogates and values past U+10FFFF.
    static constexpr std::uint32_t kMinimum[] = {0x0U, 0x80U, 0x800U, 0x10000U};
    if (code_point < kMinimum[continuation] || code_point > 0x10FFFFU ||
        (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
      return false;
    }
    i += continuation + 1;
  }
  return true;
}

bool IsBadgeLine(std::string_view line_text) {
  std::string_view rest = TrimWhitespace(line_text);
  if (rest.empty()) {
    return false;
  }
  while (!rest.empty()) {
    const std::size_t consumed = MatchBadgeMarker(rest);
    if (consumed == 0) {
      return false;
    }
    rest = TrimWhitespace(rest.substr(consumed));
  }
  return true;
}

} // namespace packdoc::document
