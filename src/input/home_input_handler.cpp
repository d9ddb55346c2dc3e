#include "input/home_input_handler.hpp"

#include "hearth/model/HomeScreenModel.hpp"
#include "input/input_bindings.hpp"

#include <utility>

namespace hearth::input
{

HomeInputHandler::HomeInputHandler(model::HomeScreenModel& model, HitTester hitTester)
    : model_(model)
    , hitTester_(std::move(hitTester))
{}

void HomeInputHandler::Register(InputRouter& router)
{
    router.RegisterHandler(SDL_KEYDOWN, [this](const SDL_Event& event, bool& running) {
        return HandleKeyDown(event, running);
    });
    router.RegisterHandler(SDL_CONTROLLERBUTTONDOWN, [this](const SDL_Event& event, bool& running) {
        return HandleControllerButtonDown(event, running);
    });
    router.RegisterHandler(SDL_MOUSEBUTTONDOWN, [this](const SDL_Event& event, bool& running) {
        return HandleMouseButtonDown(event, running);
    });
    router.RegisterHandler(SDL_MOUSEBUTTONUP, [this](const SDL_Event& event, bool& running) {
        return HandleMouseButtonUp(event, running);
    });
    router.RegisterHandler(SDL_MOUSEMOTION, [this](const SDL_Event& event, bool& running) {
        return HandleMouseMotion(event, running);
    });
    router.RegisterHandler(SDL_QUIT, [this](const SDL_Event& event, bool& running) {
        return HandleQuit(event, running);
    });
}

bool HomeInputHandler::HandleKeyDown(const SDL_Event& event, bool& running)
{
    return Execute(MapKey(event.key.keysym.sym), running);
}

bool HomeInputHandler::HandleControllerButtonDown(const SDL_Event& event, bool& running)
{
    return Execute(MapControllerButton(event.cbutton.button), running);
}

bool HomeInputHandler::HandleMouseButtonDown(const SDL_Event& event, bool& running)
{
    (void)running;
    if (event.button.button != SDL_BUTTON_LEFT)
    {
        return false;
    }

    const focus::FocusId id = hitTester_ ? hitTester_(event.button.x, event.button.y) : focus::FocusId{};
    if (!id.empty())
    {
        model_.SetFocus(id);
    }
    model_.PointerPressed(id);
    return true;
}

bool HomeInputHandler::HandleMouseButtonUp(const SDL_Event& event, bool& running)
{
    (void)running;
    if (event.button.button != SDL_BUTTON_LEFT)
    {
        return false;
    }

    const focus::FocusId id = hitTester_ ? hitTester_(event.button.x, event.button.y) : focus::FocusId{};
    model_.PointerReleased(id);
    return true;
}

bool HomeInputHandler::HandleMouseMotion(const SDL_Event& event, bool& running)
{
    (void)running;
    const focus::FocusId id = hitTester_ ? hitTester_(event.motion.x, event.motion.y) : focus::FocusId{};
    model_.PointerHovered(id);
    if (!id.empty())
    {
        model_.SetFocus(id);
    }
    return true;
}

bool HomeInputHandler::HandleQuit(const SDL_Event& event, bool& running)
{
    (void)event;
    running = false;
    return true;
}

bool HomeInputHandler::Execute(const InputCommand& command, bool& running)
{
    switch (command.kind)
    {
    case InputCommand::Kind::Navigate:
        model_.Navigate(command.directive);
        return true;
    case InputCommand::Kind::Confirm:
        model_.Confirm();
        return true;
    case InputCommand::Kind::Quit:
        running = false;
        return true;
    case InputCommand::Kind::None:
        break;
    }
    return false;
}

} // namespace hearth::input
