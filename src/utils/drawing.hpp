#pragma once

#include <SDL2/SDL.h>

namespace hearth::drawing
{

void RenderFilledRoundedRect(SDL_Renderer* renderer, const SDL_Rect& rect, int radius);

//! Draws a rectangle outline growing inwards from the rect edge.
void RenderOutline(SDL_Renderer* renderer, const SDL_Rect& rect, int thickness);

//! Shrinks the rect by the given inset on every side; never below zero size.
[[nodiscard]] SDL_Rect Inset(const SDL_Rect& rect, int inset);

} // namespace hearth::drawing
