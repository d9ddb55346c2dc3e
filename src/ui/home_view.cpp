#include "ui/home_view.hpp"

#include "hearth/model/HomeScreenModel.hpp"
#include "utils/color.hpp"
#include "utils/drawing.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string_view>
#include <utility>

namespace hearth::ui
{
namespace
{
constexpr int kButtonSlots = 4;
constexpr int kTileGap = 12;
constexpr int kTileRadius = 10;
constexpr int kFocusOutline = 3;

// Title bar slot of each button; slot 2 stays empty.
int ButtonSlot(focus::ButtonKind kind)
{
    switch (kind)
    {
    case focus::ButtonKind::Games:
        return 0;
    case focus::ButtonKind::RecentlyPlayed:
        return 1;
    case focus::ButtonKind::Settings:
        return 3;
    }
    return 0;
}

std::string_view ButtonLabel(focus::ButtonKind kind)
{
    switch (kind)
    {
    case focus::ButtonKind::Games:
        return "Games";
    case focus::ButtonKind::RecentlyPlayed:
        return "Recently Played";
    case focus::ButtonKind::Settings:
        return "Settings";
    }
    return {};
}

bool PointInRect(const SDL_Rect& rect, int x, int y)
{
    return x >= rect.x && x < rect.x + rect.w && y >= rect.y && y < rect.y + rect.h;
}
} // namespace

HomeView::HomeView(SDL_Renderer* renderer, TTF_Font* font, HomeTheme theme, int titleBarHeight)
    : renderer_(renderer)
    , font_(font)
    , theme_(theme)
    , titleBarHeight_(titleBarHeight)
{}

bool HomeView::LoadBackground(const std::filesystem::path& path)
{
    sdl::SurfaceHandle surface{SDL_LoadBMP(path.string().c_str())};
    if (!surface)
    {
        std::cerr << "[HomeView] Unable to load background '" << path.string() << "': " << SDL_GetError() << '\n';
        return false;
    }

    background_ = sdl::TextureHandle{SDL_CreateTextureFromSurface(renderer_, surface.get())};
    if (!background_)
    {
        std::cerr << "[HomeView] Unable to create background texture: " << SDL_GetError() << '\n';
        return false;
    }
    return true;
}

SDL_Rect HomeView::GamesViewport(int width, int height) const noexcept
{
    return SDL_Rect{0, titleBarHeight_, std::max(0, width), std::max(0, height - titleBarHeight_)};
}

void HomeView::Render(const model::HomeScreenModel& model, int width, int height)
{
    regions_.clear();
    if (model.GamesRevision() != labelsRevision_)
    {
        // Titles of replaced games would otherwise stay cached forever.
        labels_.clear();
        labelsRevision_ = model.GamesRevision();
    }
    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);

    RenderBackground(width, height);
    const SDL_Rect viewport = GamesViewport(width, height);
    RenderGames(model, viewport);
    RenderTitleBar(model, width);
}

focus::FocusId HomeView::HitTest(int x, int y) const
{
    // Title bar regions are recorded last and drawn on top.
    for (auto it = regions_.rbegin(); it != regions_.rend(); ++it)
    {
        if (PointInRect(it->rect, x, y))
        {
            return it->id;
        }
    }
    return {};
}

void HomeView::RenderBackground(int width, int height)
{
    const SDL_Rect area{0, 0, width, height};
    if (background_)
    {
        SDL_RenderCopy(renderer_, background_.get(), nullptr, &area);
        return;
    }
    color::RenderVerticalGradient(renderer_, area, theme_.background, theme_.backgroundGradientEnd);
}

void HomeView::RenderTitleBar(const model::HomeScreenModel& model, int width)
{
    const SDL_Rect bar{0, 0, width, titleBarHeight_};
    color::SetDrawColor(renderer_, theme_.titleBar);
    SDL_RenderFillRect(renderer_, &bar);

    const int slotWidth = width / kButtonSlots;
    for (const auto kind : {focus::ButtonKind::Games, focus::ButtonKind::RecentlyPlayed, focus::ButtonKind::Settings})
    {
        const focus::FocusId id = focus::MakeButtonId(kind);
        const SDL_Rect slot{ButtonSlot(kind) * slotWidth, 0, slotWidth, titleBarHeight_};
        const SDL_Rect button = drawing::Inset(slot, kTileGap);

        if (model.Activations().IsPressed(id))
        {
            color::SetDrawColor(renderer_, theme_.buttonPressed);
            drawing::RenderFilledRoundedRect(renderer_, button, kTileRadius);
        }
        else if (model.Focus().IsFocused(id))
        {
            color::SetDrawColor(renderer_, theme_.buttonFocused);
            drawing::RenderOutline(renderer_, button, kFocusOutline);
        }

        RenderTextCentered(renderer_, Label(std::string{ButtonLabel(kind)}, theme_.buttonText), button);
        regions_.push_back(HitRegion{button, id});
    }
}

void HomeView::RenderGames(const model::HomeScreenModel& model, const SDL_Rect& viewport)
{
    const auto& layout = model.TileLayout();
    const auto& games = model.Games().Items();
    if (viewport.w <= 0 || viewport.h <= 0)
    {
        return;
    }

    KeepFocusedTileVisible(model, viewport);

    if (games.empty())
    {
        const TextTexture& empty = Label("No games installed", theme_.muted);
        RenderTextCentered(renderer_, empty, viewport);
        return;
    }

    SDL_RenderSetClipRect(renderer_, &viewport);
    for (const auto& tile : layout.tiles)
    {
        if (tile.index >= games.size())
        {
            break;
        }

        const SDL_Rect cell{
            viewport.x + static_cast<int>(std::lround(tile.x)),
            viewport.y + static_cast<int>(std::lround(tile.y - scrollOffset_)),
            static_cast<int>(std::lround(tile.width)),
            static_cast<int>(std::lround(tile.height))};
        if (cell.y + cell.h < viewport.y || cell.y > viewport.y + viewport.h)
        {
            continue;
        }

        const auto& game = games[tile.index];
        const focus::FocusId id = focus::MakeGameId(game.uuid);
        const SDL_Rect card = drawing::Inset(cell, kTileGap / 2);

        SDL_Color fill = theme_.tile;
        if (model.Activations().IsPressed(id))
        {
            fill = theme_.tilePressed;
        }
        else if (model.HoveredId() == id)
        {
            fill = theme_.tileHover;
        }
        color::SetDrawColor(renderer_, fill);
        drawing::RenderFilledRoundedRect(renderer_, card, kTileRadius);

        if (model.Focus().IsFocused(id))
        {
            color::SetDrawColor(renderer_, theme_.tileFocusedOutline);
            drawing::RenderOutline(renderer_, card, kFocusOutline);
        }

        RenderTextCentered(renderer_, Label(game.title, theme_.tileTitle), drawing::Inset(card, kTileGap));

        SDL_Rect visible{};
        if (SDL_IntersectRect(&card, &viewport, &visible) == SDL_TRUE)
        {
            regions_.push_back(HitRegion{visible, id});
        }
    }
    SDL_RenderSetClipRect(renderer_, nullptr);
}

void HomeView::KeepFocusedTileVisible(const model::HomeScreenModel& model, const SDL_Rect& viewport)
{
    const auto& layout = model.TileLayout();
    const float viewportHeight = static_cast<float>(viewport.h);
    const float maxScroll = std::max(0.0f, layout.contentHeight - viewportHeight);

    const focus::FocusId& focused = model.Focus().Get();
    if (focus::IsGameId(focused))
    {
        const std::string_view uuid = std::string_view{focused}.substr(std::string_view{focus::kGamePrefix}.size());
        const auto& games = model.Games().Items();
        for (const auto& tile : layout.tiles)
        {
            if (tile.index < games.size() && games[tile.index].uuid == uuid)
            {
                if (tile.y < scrollOffset_)
                {
                    scrollOffset_ = tile.y;
                }
                else if (tile.y + tile.height > scrollOffset_ + viewportHeight)
                {
                    scrollOffset_ = tile.y + tile.height - viewportHeight;
                }
                break;
            }
        }
    }
    else if (!focused.empty())
    {
        scrollOffset_ = 0.0f;
    }

    scrollOffset_ = std::clamp(scrollOffset_, 0.0f, maxScroll);
}

const TextTexture& HomeView::Label(const std::string& text, SDL_Color color)
{
    const std::string key = text + '#' + std::to_string(color.r) + ',' + std::to_string(color.g) + ','
        + std::to_string(color.b);
    auto it = labels_.find(key);
    if (it == labels_.end())
    {
        it = labels_.emplace(key, CreateTextTexture(renderer_, font_, text, color)).first;
    }
    return it->second;
}

} // namespace hearth::ui
