#include "utils/asset_paths.hpp"

#include <SDL2/SDL.h>

#include <system_error>
#include <vector>

namespace hearth::paths
{
namespace
{
std::vector<std::filesystem::path> BuildAssetCandidates(const std::filesystem::path& relative)
{
    std::vector<std::filesystem::path> candidates;
    candidates.emplace_back(relative);

    if (char* rawBasePath = SDL_GetBasePath(); rawBasePath != nullptr)
    {
        std::filesystem::path basePath{rawBasePath};
        SDL_free(rawBasePath);

        candidates.emplace_back(basePath / relative);
        const std::filesystem::path parent = basePath.parent_path().parent_path();
        if (!parent.empty())
        {
            candidates.emplace_back(parent / relative);
        }
    }

    return candidates;
}
} // namespace

std::filesystem::path ResolveAssetPath(const std::filesystem::path& relativePath)
{
    if (relativePath.empty() || relativePath.is_absolute())
    {
        return relativePath;
    }

    std::error_code error;
    for (const auto& candidate : BuildAssetCandidates(relativePath))
    {
        if (std::filesystem::exists(candidate, error))
        {
            return candidate;
        }
    }

    return relativePath;
}

} // namespace hearth::paths
