#pragma once

#include "hearth/focus/FocusId.hpp"
#include "ui/theme.hpp"
#include "utils/sdl_wrappers.hpp"
#include "utils/text.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

namespace hearth::model
{
class HomeScreenModel;
}

namespace hearth::ui
{

//! Draws the home screen: background, title bar buttons and the scrolling
//! game grid. Hit regions from the last frame answer pointer queries.
class HomeView
{
  public:
    HomeView(SDL_Renderer* renderer, TTF_Font* font, HomeTheme theme, int titleBarHeight);

    //! A missing or unreadable image leaves the gradient background in place.
    bool LoadBackground(const std::filesystem::path& path);

    //! Area below the title bar that holds the game grid.
    [[nodiscard]] SDL_Rect GamesViewport(int width, int height) const noexcept;

    void Render(const model::HomeScreenModel& model, int width, int height);

    [[nodiscard]] focus::FocusId HitTest(int x, int y) const;

  private:
    struct HitRegion
    {
        SDL_Rect rect;
        focus::FocusId id;
    };

    void RenderBackground(int width, int height);
    void RenderTitleBar(const model::HomeScreenModel& model, int width);
    void RenderGames(const model::HomeScreenModel& model, const SDL_Rect& viewport);
    void KeepFocusedTileVisible(const model::HomeScreenModel& model, const SDL_Rect& viewport);
    const TextTexture& Label(const std::string& text, SDL_Color color);

    SDL_Renderer* renderer_;
    TTF_Font* font_;
    HomeTheme theme_;
    int titleBarHeight_;
    sdl::TextureHandle background_;
    std::unordered_map<std::string, TextTexture> labels_;
    std::uint64_t labelsRevision_ = 0;
    std::vector<HitRegion> regions_;
    float scrollOffset_ = 0.0f;
};

} // namespace hearth::ui
