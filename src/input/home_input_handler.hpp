#pragma once

#include "hearth/focus/FocusId.hpp"
#include "input/input_router.h"

#include <SDL2/SDL.h>

#include <functional>

namespace hearth::model
{
class HomeScreenModel;
}

namespace hearth::input
{

struct InputCommand;

//! Routes keyboard, controller and mouse events to the home screen model.
class HomeInputHandler
{
  public:
    //! Returns the id of the element under a window coordinate, or an empty id.
    using HitTester = std::function<focus::FocusId(int, int)>;

    HomeInputHandler(model::HomeScreenModel& model, HitTester hitTester);
    void Register(InputRouter& router);

  private:
    bool HandleKeyDown(const SDL_Event& event, bool& running);
    bool HandleControllerButtonDown(const SDL_Event& event, bool& running);
    bool HandleMouseButtonDown(const SDL_Event& event, bool& running);
    bool HandleMouseButtonUp(const SDL_Event& event, bool& running);
    bool HandleMouseMotion(const SDL_Event& event, bool& running);
    bool HandleQuit(const SDL_Event& event, bool& running);
    bool Execute(const InputCommand& command, bool& running);

    model::HomeScreenModel& model_;
    HitTester hitTester_;
};

} // namespace hearth::input
