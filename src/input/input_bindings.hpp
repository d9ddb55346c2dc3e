#pragma once

#include "hearth/layout/LayoutGrid.hpp"

#include <SDL2/SDL.h>

namespace hearth::input
{

struct InputCommand
{
    enum class Kind
    {
        None,
        Navigate,
        Confirm,
        Quit,
    };

    Kind kind = Kind::None;
    layout::NavigationDirective directive;

    [[nodiscard]] static InputCommand None() noexcept { return InputCommand{}; }
    [[nodiscard]] static InputCommand Navigate(layout::NavigationDirective directive) noexcept
    {
        return InputCommand{Kind::Navigate, directive};
    }
    [[nodiscard]] static InputCommand Confirm() noexcept { return InputCommand{Kind::Confirm, {}}; }
    [[nodiscard]] static InputCommand Quit() noexcept { return InputCommand{Kind::Quit, {}}; }
};

[[nodiscard]] InputCommand MapKey(SDL_Keycode key) noexcept;
[[nodiscard]] InputCommand MapControllerButton(Uint8 button) noexcept;

} // namespace hearth::input
