#pragma once

#include "hearth/focus/FocusId.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

namespace hearth::focus
{

class FocusStore;

//! Turns completed clicks and confirm presses into one typed notification.
//! The dispatcher never touches the focus store; only explicit focus calls do.
class ActivationDispatcher
{
  public:
    using Handler = std::function<void(const Activation&)>;

    void OnActivation(Handler handler);

    // The host reports the element under the pointer; an empty id means none.
    void PointerPressed(std::string_view id);
    bool PointerReleased(std::string_view id);
    void PointerCancelled() noexcept;

    [[nodiscard]] const FocusId& PressedId() const noexcept { return pressed_; }
    [[nodiscard]] bool IsPressed(std::string_view id) const noexcept;

    bool Confirm(const FocusStore& store);
    bool Activate(std::string_view id);

    [[nodiscard]] std::size_t DispatchCount() const noexcept { return dispatchCount_; }

  private:
    Handler handler_;
    FocusId pressed_;
    std::size_t dispatchCount_ = 0;
};

} // namespace hearth::focus
