#pragma once

#include "fragments/fragment.hpp"
#include "manifest/manifest.hpp"

#include <string>

namespace packdoc::fragments {

// Markdown for the `## Installation` section. The heading text is what the
// section locator keys on, so it must keep the word "Installation".
std::string BuildInstallationMarkdown(const manifest::Manifest& manifest);

// Install fragment; not applicable for reference/deprecated/archived packages.
Fragment BuildInstallFragment(const manifest::Manifest& manifest);

} // namespace packdoc::fragments
