#include "report/palette.hpp"

#include <cstdlib>

#if defined(__linux__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace packdoc::report {

Palette PlainPalette() {
  return Palette{};
}

Palette AnsiPalette() {
  Palette palette;
  palette.red = "\033[31m";
  palette.green = "\033[32m";
  palette.cyan = "\033[36m";
  palette.dim = "\033[2m";
  palette.reset = "\033[0m";
  return palette;
}

Palette MakePalette(bool color_enabled) {
  return color_enabled ? AnsiPalette() : PlainPalette();
}

bool ColorEnabledFromEnvironment() {
  const char* no_color = std::getenv("NO_COLOR");
  if (no_color != nullptr && no_color[0] != '\0') {
    return false;
  }
  const char* term = std::getenv("TERM");
  if (term != nullptr && std::string_view(term) == "dumb") {
    return false;
  }
#if defined(__linux__) || defined(__APPLE__)
  return isatty(STDOUT_FILENO) == 1;
#else
  return true;
#endif
}

} // namespace packdoc::report
