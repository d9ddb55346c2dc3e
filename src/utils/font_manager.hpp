#pragma once

#include <filesystem>
#include <string>

namespace hearth::fonts
{

//! Picks the UI font. HEARTH_FONT_PATH wins when it names an existing file,
//! then the configured path, then the bundled font, then known system fonts.
//! Returns an empty string when nothing usable exists.
std::string ResolveFontPath(const std::filesystem::path& configuredPath = {});

} // namespace hearth::fonts
