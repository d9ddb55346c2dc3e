#include "hearth/model/HomeScreenModel.hpp"

#include "hearth/layout/HomeLayout.hpp"

#include <iostream>
#include <unordered_set>
#include <utility>

namespace hearth::model
{

HomeScreenModel::HomeScreenModel(layout::GridLayoutConfig gridConfig)
    : grid_{gridConfig}
    , navigation_{layout::CreateHomeNavigationController(gridConfig)}
{
    if (const auto& initial = navigation_->CurrentFocusId())
    {
        focus_.Set(*initial);
    }

    // Focus written from outside (host or pointer) moves the navigation
    // position too, so the next directional move starts from it.
    focusSubscription_ = focus_.Subscribe([this](const focus::FocusId& id) {
        if (!id.empty() && navigation_->CurrentFocusId() != id)
        {
            navigation_->FocusById(id);
        }
    });

    games_.OnChanged([this](const std::vector<GameData>& games) { RebuildGames(games); });
    RecomputeTiles();
}

HomeScreenModel::~HomeScreenModel()
{
    focus_.Unsubscribe(focusSubscription_);
}

const std::vector<focus::FocusId>& HomeScreenModel::ButtonIds()
{
    static const std::vector<focus::FocusId> ids{
        focus::MakeButtonId(focus::ButtonKind::Games),
        focus::MakeButtonId(focus::ButtonKind::RecentlyPlayed),
        focus::MakeButtonId(focus::ButtonKind::Settings),
    };
    return ids;
}

void HomeScreenModel::SetFocus(focus::FocusId id)
{
    focus_.Set(std::move(id));
}

void HomeScreenModel::ReplaceGames(std::vector<GameData> games)
{
    games_.Replace(std::move(games));
}

void HomeScreenModel::Resize(float viewportWidth, float viewportHeight)
{
    viewportWidth_ = viewportWidth;
    viewportHeight_ = viewportHeight;
    RecomputeTiles();
}

layout::NavigationResult HomeScreenModel::Navigate(const layout::NavigationDirective& directive)
{
    auto result = navigation_->Navigate(directive);
    if (result.kind != layout::NavigationResult::Kind::NoNextItem)
    {
        focus_.Set(result.focusId);
    }
    return result;
}

bool HomeScreenModel::Confirm()
{
    return activations_.Confirm(focus_);
}

void HomeScreenModel::PointerPressed(std::string_view id)
{
    activations_.PointerPressed(id);
}

bool HomeScreenModel::PointerReleased(std::string_view id)
{
    return activations_.PointerReleased(id);
}

void HomeScreenModel::PointerHovered(std::string_view id)
{
    hovered_.assign(id);
}

void HomeScreenModel::RebuildGames(const std::vector<GameData>& games)
{
    ++gamesRevision_;
    const std::string gamesLayoutId{layout::kGamesLayoutId};
    navigation_->ClearLayout(gamesLayoutId);

    std::unordered_set<std::string> seen;
    for (const auto& game : games)
    {
        if (!seen.insert(game.uuid).second)
        {
            std::cerr << "[Home] Duplicate game uuid '" << game.uuid
                      << "'; every tile sharing it will show focus." << '\n';
        }
        navigation_->InsertElement(gamesLayoutId, focus::MakeGameId(game.uuid));
    }

    RecomputeTiles();

    const focus::FocusId& focused = focus_.Get();
    if (focused.empty())
    {
        return;
    }
    if (!navigation_->FocusById(focused) && focus::IsGameId(focused))
    {
        // The focused tile is gone; fall back to the games button.
        focus_.Set(focus::MakeButtonId(focus::ButtonKind::Games));
        navigation_->FocusById(focus_.Get());
    }
}

void HomeScreenModel::RecomputeTiles()
{
    tileLayout_ = grid_.Compute(games_.Size(), viewportWidth_, viewportHeight_);
}

} // namespace hearth::model
