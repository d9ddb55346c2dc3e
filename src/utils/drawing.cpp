#include "utils/drawing.hpp"

#include <algorithm>
#include <cmath>

namespace hearth::drawing
{

void RenderFilledRoundedRect(SDL_Renderer* renderer, const SDL_Rect& rect, int radius)
{
    if (renderer == nullptr || rect.w <= 0 || rect.h <= 0)
    {
        return;
    }

    radius = std::clamp(radius, 0, std::min(rect.w, rect.h) / 2);
    if (radius == 0)
    {
        SDL_RenderFillRect(renderer, &rect);
        return;
    }

    // One horizontal span per scanline, narrowed inside the corner arcs.
    for (int row = 0; row < rect.h; ++row)
    {
        int inset = 0;
        const int fromEdge = std::min(row, rect.h - 1 - row);
        if (fromEdge < radius)
        {
            const float dy = static_cast<float>(radius - fromEdge) - 0.5f;
            const float dx = std::sqrt(std::max(0.0f, static_cast<float>(radius * radius) - dy * dy));
            inset = radius - static_cast<int>(std::lround(dx));
        }
        SDL_RenderDrawLine(renderer, rect.x + inset, rect.y + row, rect.x + rect.w - 1 - inset, rect.y + row);
    }
}

void RenderOutline(SDL_Renderer* renderer, const SDL_Rect& rect, int thickness)
{
    if (renderer == nullptr)
    {
        return;
    }

    for (int step = 0; step < thickness; ++step)
    {
        const SDL_Rect ring = Inset(rect, step);
        if (ring.w <= 0 || ring.h <= 0)
        {
            break;
        }
        SDL_RenderDrawRect(renderer, &ring);
    }
}

SDL_Rect Inset(const SDL_Rect& rect, int inset)
{
    return SDL_Rect{rect.x + inset, rect.y + inset, std::max(0, rect.w - inset * 2), std::max(0, rect.h - inset * 2)};
}

} // namespace hearth::drawing
