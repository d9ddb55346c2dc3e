#include "input/input_router.h"

#include <utility>

namespace hearth::input
{

void InputRouter::RegisterHandler(Uint32 eventType, Handler handler)
{
    if (!handler)
    {
        return;
    }
    handlers_[eventType].push_back(std::move(handler));
}

bool InputRouter::Dispatch(const SDL_Event& event, bool& running) const
{
    auto it = handlers_.find(event.type);
    if (it == handlers_.end())
    {
        return false;
    }

    for (const auto& handler : it->second)
    {
        if (handler(event, running))
        {
            return true;
        }
    }

    return false;
}

std::size_t InputRouter::HandlerCount(Uint32 eventType) const
{
    auto it = handlers_.find(eventType);
    return it == handlers_.end() ? 0 : it->second.size();
}

} // namespace hearth::input
