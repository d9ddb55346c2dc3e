#include "utils/color.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace hearth::color
{
namespace
{
int HexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f')
    {
        return 10 + (lower - 'a');
    }
    return -1;
}
} // namespace

SDL_Color ParseHexColor(std::string_view hex, SDL_Color fallback)
{
    if (!hex.empty() && hex.front() == '#')
    {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6 && hex.size() != 8)
    {
        return fallback;
    }

    Uint8 channels[4]{0, 0, 0, SDL_ALPHA_OPAQUE};
    for (std::size_t index = 0; index < hex.size() / 2; ++index)
    {
        const int high = HexValue(hex[index * 2]);
        const int low = HexValue(hex[index * 2 + 1]);
        if (high < 0 || low < 0)
        {
            return fallback;
        }
        channels[index] = static_cast<Uint8>((high << 4) | low);
    }

    return SDL_Color{channels[0], channels[1], channels[2], channels[3]};
}

SDL_Color Mix(const SDL_Color& a, const SDL_Color& b, float t)
{
    t = std::clamp(t, 0.0f, 1.0f);
    auto blend = [t](Uint8 from, Uint8 to) {
        return static_cast<Uint8>(from + static_cast<int>((to - from) * t));
    };
    return SDL_Color{blend(a.r, b.r), blend(a.g, b.g), blend(a.b, b.b), blend(a.a, b.a)};
}

void RenderVerticalGradient(SDL_Renderer* renderer, const SDL_Rect& area, SDL_Color top, SDL_Color bottom)
{
    if (renderer == nullptr || area.h <= 0)
    {
        return;
    }

    for (int offset = 0; offset < area.h; ++offset)
    {
        const float t = area.h > 1 ? static_cast<float>(offset) / static_cast<float>(area.h - 1) : 0.0f;
        SetDrawColor(renderer, Mix(top, bottom, t));
        SDL_RenderDrawLine(renderer, area.x, area.y + offset, area.x + area.w - 1, area.y + offset);
    }
}

void SetDrawColor(SDL_Renderer* renderer, const SDL_Color& color)
{
    SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
}

} // namespace hearth::color
