#include "input/input_bindings.hpp"

namespace hearth::input
{
namespace
{
InputCommand Move(layout::Direction direction) noexcept
{
    return InputCommand::Navigate(layout::NavigationDirective::Move(direction));
}

InputCommand Shoulder(layout::SpecialButton button) noexcept
{
    return InputCommand::Navigate(layout::NavigationDirective::Press(button));
}
} // namespace

InputCommand MapKey(SDL_Keycode key) noexcept
{
    switch (key)
    {
    case SDLK_UP:
        return Move(layout::Direction::Up);
    case SDLK_DOWN:
        return Move(layout::Direction::Down);
    case SDLK_LEFT:
        return Move(layout::Direction::Left);
    case SDLK_RIGHT:
        return Move(layout::Direction::Right);
    case SDLK_PAGEUP:
        return Shoulder(layout::SpecialButton::ShoulderLeft);
    case SDLK_PAGEDOWN:
        return Shoulder(layout::SpecialButton::ShoulderRight);
    case SDLK_RETURN:
    case SDLK_KP_ENTER:
    case SDLK_SPACE:
        return InputCommand::Confirm();
    case SDLK_ESCAPE:
        return InputCommand::Quit();
    default:
        return InputCommand::None();
    }
}

InputCommand MapControllerButton(Uint8 button) noexcept
{
    switch (static_cast<SDL_GameControllerButton>(button))
    {
    case SDL_CONTROLLER_BUTTON_DPAD_UP:
        return Move(layout::Direction::Up);
    case SDL_CONTROLLER_BUTTON_DPAD_DOWN:
        return Move(layout::Direction::Down);
    case SDL_CONTROLLER_BUTTON_DPAD_LEFT:
        return Move(layout::Direction::Left);
    case SDL_CONTROLLER_BUTTON_DPAD_RIGHT:
        return Move(layout::Direction::Right);
    case SDL_CONTROLLER_BUTTON_LEFTSHOULDER:
        return Shoulder(layout::SpecialButton::ShoulderLeft);
    case SDL_CONTROLLER_BUTTON_RIGHTSHOULDER:
        return Shoulder(layout::SpecialButton::ShoulderRight);
    case SDL_CONTROLLER_BUTTON_A:
        return InputCommand::Confirm();
    default:
        return InputCommand::None();
    }
}

} // namespace hearth::input
