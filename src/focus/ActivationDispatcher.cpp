#include "hearth/focus/ActivationDispatcher.hpp"

#include "hearth/focus/FocusStore.hpp"

#include <iostream>
#include <utility>

namespace hearth::focus
{

void ActivationDispatcher::OnActivation(Handler handler)
{
    handler_ = std::move(handler);
}

void ActivationDispatcher::PointerPressed(std::string_view id)
{
    pressed_.assign(id);
}

bool ActivationDispatcher::PointerReleased(std::string_view id)
{
    const FocusId pressed = std::exchange(pressed_, FocusId{});
    if (pressed.empty() || pressed != id)
    {
        return false;
    }
    return Activate(pressed);
}

void ActivationDispatcher::PointerCancelled() noexcept
{
    pressed_.clear();
}

bool ActivationDispatcher::IsPressed(std::string_view id) const noexcept
{
    return !pressed_.empty() && pressed_ == id;
}

bool ActivationDispatcher::Confirm(const FocusStore& store)
{
    if (!store.HasFocus())
    {
        return false;
    }
    return Activate(store.Get());
}

bool ActivationDispatcher::Activate(std::string_view id)
{
    const auto activation = ParseActivation(id);
    if (!activation.has_value())
    {
        std::cerr << "[Activation] Ignoring unrecognised element id '" << id << "'." << '\n';
        return false;
    }

    ++dispatchCount_;
    if (handler_)
    {
        handler_(*activation);
    }
    return true;
}

} // namespace hearth::focus
