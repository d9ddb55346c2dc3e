#include "hearth/layout/HomeLayout.hpp"

#include "hearth/focus/FocusId.hpp"

#include <utility>

namespace hearth::layout
{
namespace
{
constexpr std::size_t kHomeWidth = 4;
constexpr std::size_t kHomeHeight = 6;
} // namespace

std::unique_ptr<NavigationController> CreateHomeNavigationController(const GridLayoutConfig& gridConfig)
{
    Validate(gridConfig);

    auto root = std::make_unique<LayoutGrid>(kHomeWidth, kHomeHeight, LayoutId{kHomeLayoutId});
    root->AddElement(Rect{0, 0, 0, 0}, focus::MakeButtonId(focus::ButtonKind::Games))
        .AddElement(Rect{1, 1, 0, 0}, focus::MakeButtonId(focus::ButtonKind::RecentlyPlayed))
        .AddElement(Rect{3, 3, 0, 0}, focus::MakeButtonId(focus::ButtonKind::Settings));

    LayoutGrid& games = root->AddSublayout(
        Rect{0, kHomeWidth - 1, 1, kHomeHeight - 1},
        LayoutId{kGamesLayoutId},
        gridConfig.columns,
        gridConfig.visibleRows);
    games.SetGrowable(GrowConfig{1, 1, GrowDirection::GrowX});
    games.MapSpecialButton(SpecialButton::ShoulderLeft, SpecialAction::NavigateOutLeft);
    games.MapSpecialButton(SpecialButton::ShoulderRight, SpecialAction::NavigateOutRight);

    return std::make_unique<NavigationController>(std::move(root));
}

} // namespace hearth::layout
