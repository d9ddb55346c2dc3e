#include "utils/font_manager.hpp"

#include "utils/asset_paths.hpp"

#include <array>
#include <cstdlib>
#include <iostream>
#include <system_error>
#include <vector>

namespace hearth::fonts
{
namespace
{
constexpr char kBundledFont[] = "assets/fonts/DejaVuSans.ttf";

const std::array<std::filesystem::path, 4> kSystemFontCandidates{
    std::filesystem::path{"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"},
    std::filesystem::path{"/usr/share/fonts/TTF/DejaVuSans.ttf"},
    std::filesystem::path{"/usr/local/share/fonts/DejaVuSans.ttf"},
    std::filesystem::path{"/Library/Fonts/DejaVuSans.ttf"}};

bool FileExists(const std::filesystem::path& path)
{
    std::error_code error;
    return !path.empty() && std::filesystem::is_regular_file(path, error);
}
} // namespace

std::string ResolveFontPath(const std::filesystem::path& configuredPath)
{
    if (const char* envFontPath = std::getenv("HEARTH_FONT_PATH"); envFontPath != nullptr && *envFontPath != '\0')
    {
        const std::filesystem::path envPath{envFontPath};
        if (FileExists(envPath))
        {
            return envPath.string();
        }
        std::cerr << "[Fonts] HEARTH_FONT_PATH is set to '" << envFontPath
                  << "', but the file could not be found. Falling back to defaults.\n";
    }

    std::vector<std::filesystem::path> candidates;
    if (!configuredPath.empty())
    {
        candidates.emplace_back(paths::ResolveAssetPath(configuredPath));
    }
    candidates.emplace_back(paths::ResolveAssetPath(kBundledFont));
    candidates.insert(candidates.end(), kSystemFontCandidates.begin(), kSystemFontCandidates.end());

    for (const auto& candidate : candidates)
    {
        if (FileExists(candidate))
        {
            return candidate.string();
        }
    }

    if (!configuredPath.empty())
    {
        std::cerr << "[Fonts] Configured font '" << configuredPath.string() << "' was not found.\n";
    }
    return {};
}

} // namespace hearth::fonts
