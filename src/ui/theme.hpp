#pragma once

#include <SDL2/SDL.h>

namespace hearth::ui
{

struct HomeTheme
{
    SDL_Color background{};
    SDL_Color backgroundGradientEnd{};
    SDL_Color titleBar{};
    SDL_Color buttonText{};
    SDL_Color buttonFocused{};
    SDL_Color buttonPressed{};
    SDL_Color tile{};
    SDL_Color tileHover{};
    SDL_Color tileFocusedOutline{};
    SDL_Color tilePressed{};
    SDL_Color tileTitle{};
    SDL_Color muted{};
};

[[nodiscard]] HomeTheme DefaultHomeTheme();

} // namespace hearth::ui
