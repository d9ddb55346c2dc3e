#pragma once

#include "hearth/layout/GridLayout.hpp"
#include "hearth/layout/NavigationController.hpp"

#include <memory>
#include <string_view>

namespace hearth::layout
{

inline constexpr std::string_view kHomeLayoutId = "Home";
inline constexpr std::string_view kGamesLayoutId = "Home@Games";

// ┌─────────┬─────────────────┬───┬──────────┐
// │ Games   │ Recently played │   │ Settings │  row 0
// ├─────────┴─────────────────┴───┴──────────┤
// │ Home@Games (growable, one cell per game) │  rows 1-5
// └──────────────────────────────────────────┘

//! Builds the home screen navigation tree. The games sublayout has one
//! column per tile column of the grid configuration.
[[nodiscard]] std::unique_ptr<NavigationController> CreateHomeNavigationController(const GridLayoutConfig& gridConfig);

} // namespace hearth::layout
