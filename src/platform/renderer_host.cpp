#include "platform/renderer_host.hpp"

#include <SDL2/SDL_ttf.h>

#include <iostream>

namespace hearth::platform
{

RendererHost::~RendererHost()
{
    Shutdown();
}

bool RendererHost::Init(const char* windowTitle, int width, int height)
{
    Shutdown();

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_GAMECONTROLLER) < 0)
    {
        std::cerr << "[Hearth] Failed to initialize SDL2: " << SDL_GetError() << '\n';
        return false;
    }
    sdlInitialized_ = true;

    if (TTF_Init() == -1)
    {
        std::cerr << "[Hearth] Failed to initialize SDL_ttf: " << TTF_GetError() << '\n';
        Shutdown();
        return false;
    }
    ttfInitialized_ = true;

    window_ = sdl::WindowHandle{SDL_CreateWindow(
        windowTitle,
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        width,
        height,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI)};
    if (!window_)
    {
        std::cerr << "[Hearth] Failed to create window: " << SDL_GetError() << '\n';
        Shutdown();
        return false;
    }

    renderer_ = sdl::RendererHandle{SDL_CreateRenderer(window_.get(), -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC)};
    if (!renderer_)
    {
        std::cerr << "[Hearth] Failed to create renderer: " << SDL_GetError() << '\n';
        Shutdown();
        return false;
    }

    return true;
}

void RendererHost::Shutdown()
{
    renderer_.reset();
    window_.reset();

    if (ttfInitialized_)
    {
        TTF_Quit();
        ttfInitialized_ = false;
    }
    if (sdlInitialized_)
    {
        SDL_Quit();
        sdlInitialized_ = false;
    }
}

RendererDimensions RendererHost::OutputSize() const noexcept
{
    RendererDimensions dimensions{};
    if (renderer_)
    {
        SDL_GetRendererOutputSize(renderer_.get(), &dimensions.width, &dimensions.height);
    }
    return dimensions;
}

} // namespace hearth::platform
