#pragma once

#include <string>
#include <string_view>

namespace packdoc::report {

// ANSI color set handed to every formatter. An all-empty palette renders
// plain text, so formatters never branch on a global color flag.
struct Palette {
  std::string_view red;
  std::string_view green;
  std::string_view cyan;
  std::string_view dim;
  std::string_view reset;

  std::string Paint(std::string_view color, std::string_view text) const {
    if (color.empty()) {
      return std::string(text);
    }
    std::string painted(color);
    painted += text;
    painted += reset;
    return painted;
  }
};

Palette PlainPalette();
Palette AnsiPalette();
Palette MakePalette(bool color_enabled);

// Reads NO_COLOR and TERM once; callers store the result in their options.
// Color also requires stdout to be a terminal.
bool ColorEnabledFromEnvironment();

} // namespace packdoc::report
