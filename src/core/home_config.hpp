#pragma once

#include "hearth/layout/GridLayout.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace hearth::config
{

struct WindowConfig
{
    std::string title{"Hearth"};
    int width = 1280;
    int height = 720;
};

struct HomeConfig
{
    WindowConfig window;
    layout::GridLayoutConfig grid;
    std::filesystem::path libraryPath{"assets/content/games.json"};
    std::filesystem::path backgroundPath{"assets/images/background.bmp"};
    // Empty means the default font lookup.
    std::filesystem::path fontPath;
    int fontSize = 20;
    // Height of the title bar above the game grid.
    int titleBarHeight = 96;
};

//! Missing file yields the defaults. Malformed documents and invalid grid
//! settings throw std::runtime_error.
[[nodiscard]] HomeConfig Load(const std::filesystem::path& path);
[[nodiscard]] HomeConfig Parse(const nlohmann::json& document);
[[nodiscard]] std::filesystem::path DefaultPath();

} // namespace hearth::config
