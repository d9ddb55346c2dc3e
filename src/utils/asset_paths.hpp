#pragma once

#include <filesystem>

namespace hearth::paths
{

//! Resolves a relative asset path against the working directory, the
//! executable directory and its parent. Absolute paths are returned as is.
//! Returns the input unchanged when no candidate exists.
std::filesystem::path ResolveAssetPath(const std::filesystem::path& relativePath);

} // namespace hearth::paths
