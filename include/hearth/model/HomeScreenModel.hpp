#pragma once

#include "hearth/focus/ActivationDispatcher.hpp"
#include "hearth/focus/FocusStore.hpp"
#include "hearth/layout/GridLayout.hpp"
#include "hearth/layout/NavigationController.hpp"
#include "hearth/model/Game.hpp"

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace hearth::model
{

//! Root context of the home screen. Owns the focus store, the game list, the
//! activation dispatcher and the navigation tree, and keeps them in sync.
class HomeScreenModel
{
  public:
    explicit HomeScreenModel(layout::GridLayoutConfig gridConfig = {});
    ~HomeScreenModel();

    HomeScreenModel(const HomeScreenModel&) = delete;
    HomeScreenModel& operator=(const HomeScreenModel&) = delete;

    [[nodiscard]] focus::FocusStore& Focus() noexcept { return focus_; }
    [[nodiscard]] const focus::FocusStore& Focus() const noexcept { return focus_; }
    [[nodiscard]] focus::ActivationDispatcher& Activations() noexcept { return activations_; }
    [[nodiscard]] const focus::ActivationDispatcher& Activations() const noexcept { return activations_; }
    [[nodiscard]] const GameList& Games() const noexcept { return games_; }
    //! Bumped on every game list replacement.
    [[nodiscard]] std::uint64_t GamesRevision() const noexcept { return gamesRevision_; }
    [[nodiscard]] layout::NavigationController& Navigation() noexcept { return *navigation_; }
    [[nodiscard]] const layout::GridLayout& Grid() const noexcept { return grid_; }
    [[nodiscard]] const layout::GridLayoutResult& TileLayout() const noexcept { return tileLayout_; }

    [[nodiscard]] static const std::vector<focus::FocusId>& ButtonIds();

    void SetFocus(focus::FocusId id);
    void ReplaceGames(std::vector<GameData> games);
    void Resize(float viewportWidth, float viewportHeight);

    layout::NavigationResult Navigate(const layout::NavigationDirective& directive);
    bool Confirm();

    void PointerPressed(std::string_view id);
    bool PointerReleased(std::string_view id);
    void PointerHovered(std::string_view id);
    [[nodiscard]] const focus::FocusId& HoveredId() const noexcept { return hovered_; }

  private:
    void RebuildGames(const std::vector<GameData>& games);
    void RecomputeTiles();

    focus::FocusStore focus_;
    focus::ActivationDispatcher activations_;
    GameList games_;
    layout::GridLayout grid_;
    std::unique_ptr<layout::NavigationController> navigation_;
    layout::GridLayoutResult tileLayout_;
    float viewportWidth_ = 0.0f;
    float viewportHeight_ = 0.0f;
    focus::FocusId hovered_;
    std::uint64_t gamesRevision_ = 0;
    focus::FocusStore::SubscriptionId focusSubscription_{};
};

} // namespace hearth::model
