#pragma once

#include "utils/sdl_wrappers.hpp"

#include <SDL2/SDL.h>

namespace hearth::platform
{

struct RendererDimensions
{
    int width = 0;
    int height = 0;
};

//! Owns SDL, SDL_ttf, the window and the renderer for the lifetime of the app.
class RendererHost
{
  public:
    RendererHost() = default;
    ~RendererHost();
    RendererHost(const RendererHost&) = delete;
    RendererHost& operator=(const RendererHost&) = delete;

    [[nodiscard]] bool Init(const char* windowTitle, int width, int height);
    void Shutdown();

    [[nodiscard]] SDL_Renderer* Renderer() const noexcept { return renderer_.get(); }
    [[nodiscard]] SDL_Window* Window() const noexcept { return window_.get(); }
    [[nodiscard]] RendererDimensions OutputSize() const noexcept;

  private:
    bool sdlInitialized_ = false;
    bool ttfInitialized_ = false;
    sdl::WindowHandle window_{};
    sdl::RendererHandle renderer_{};
};

} // namespace hearth::platform
