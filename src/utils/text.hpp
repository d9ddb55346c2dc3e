#pragma once

#include "utils/sdl_wrappers.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <string>
#include <string_view>

namespace hearth
{

struct TextTexture
{
    sdl::TextureHandle texture;
    int width{};
    int height{};
};

inline TextTexture CreateTextTexture(SDL_Renderer* renderer, TTF_Font* font, std::string_view text, SDL_Color color)
{
    if (font == nullptr || text.empty())
    {
        return {};
    }

    const std::string textString{text};
    sdl::SurfaceHandle surface{TTF_RenderUTF8_Blended(font, textString.c_str(), color)};
    if (!surface)
    {
        return {};
    }

    sdl::TextureHandle texture{SDL_CreateTextureFromSurface(renderer, surface.get())};
    if (!texture)
    {
        return {};
    }

    return TextTexture{std::move(texture), surface->w, surface->h};
}

//! Draws the text centred inside the bounds, clipped to them.
inline void RenderTextCentered(SDL_Renderer* renderer, const TextTexture& textTexture, const SDL_Rect& bounds)
{
    if (!textTexture.texture)
    {
        return;
    }

    const int width = textTexture.width < bounds.w ? textTexture.width : bounds.w;
    const int height = textTexture.height < bounds.h ? textTexture.height : bounds.h;
    const SDL_Rect source{0, 0, width, height};
    const SDL_Rect target{bounds.x + (bounds.w - width) / 2, bounds.y + (bounds.h - height) / 2, width, height};
    SDL_RenderCopy(renderer, textTexture.texture.get(), &source, &target);
}

} // namespace hearth
