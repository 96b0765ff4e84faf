#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace packdoc::document {

// One physical line of a document. Both views point into the document text,
// so the document must outlive the lines.
struct Line {
  std::string_view text;
  // "\n", "\r\n", or empty for a final line without terminator.
  std::string_view ending;
};

struct Heading {
  int level = 0;
  std::string_view text;
};

// Splits on '\n' and keeps each terminator beside its line. Concatenating
// text + ending over all lines reproduces the input byte for byte.
std::vector<Line> SplitLines(std::string_view document);

// Terminator used for inserted lines: the first terminator found in the
// document, "\n" when there is none.
std::string_view DetectLineEnding(std::string_view document);

std::string_view TrimWhitespace(std::string_view text);

bool IsBlank(std::string_view text);

// A heading line starts with 1-6 '#' followed by whitespace. The returned
// text has surrounding whitespace removed.
std::optional<Heading> ParseHeading(std::string_view line_text);

// Case-insensitive match of `word` bounded by non-word characters on both
// sides. Word characters are ASCII alphanumerics, '_' and non-ASCII bytes.
bool ContainsWholeWord(std::string_view text, std::string_view word);

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);

bool IsValidUtf8(std::string_view text);

// Badge marker: `![<label>](<url>)` with a recognized label and the shields
// badge URL prefix. A badge line holds one or more markers and nothing else
// except whitespace between them.
bool IsBadgeLine(std::string_view line_text);

} // namespace packdoc::document
