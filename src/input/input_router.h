#pragma once

#include <SDL2/SDL.h>

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

namespace hearth::input
{

//! Dispatches SDL events by type. Handlers for one type run in registration
//! order and the first one returning true consumes the event.
class InputRouter
{
  public:
    using Handler = std::function<bool(const SDL_Event&, bool&)>;

    void RegisterHandler(Uint32 eventType, Handler handler);
    bool Dispatch(const SDL_Event& event, bool& running) const;

    [[nodiscard]] std::size_t HandlerCount(Uint32 eventType) const;

  private:
    std::unordered_map<Uint32, std::vector<Handler>> handlers_{};
};

} // namespace hearth::input
