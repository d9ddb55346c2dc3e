#pragma once

#include "hearth/focus/FocusId.hpp"
#include "hearth/layout/LayoutGrid.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace hearth::layout
{

//! Tracks which layout holds focus and routes directives to it.
class NavigationController
{
  public:
    //! The root layout must hold a focusable element at (0, 0); that element
    //! receives the initial focus.
    explicit NavigationController(std::unique_ptr<LayoutGrid> root);

    NavigationResult Navigate(const NavigationDirective& directive);

    //! Moves the navigation position onto an element, e.g. after pointer hover.
    bool FocusById(std::string_view focusId);

    void InsertElement(std::string_view layoutId, focus::FocusId focusId);
    void ClearLayout(std::string_view layoutId);

    [[nodiscard]] const std::optional<focus::FocusId>& CurrentFocusId() const noexcept { return currentFocusId_; }
    [[nodiscard]] LayoutGrid& Root() noexcept { return *root_; }
    [[nodiscard]] const LayoutGrid& Root() const noexcept { return *root_; }
    [[nodiscard]] LayoutGrid& CurrentLayout() noexcept { return *current_; }
    [[nodiscard]] LayoutGrid* FindLayout(std::string_view layoutId) noexcept;

  private:
    [[nodiscard]] LayoutGrid& RequireLayout(std::string_view layoutId);
    void ResetToRoot();

    std::unique_ptr<LayoutGrid> root_;
    LayoutGrid* current_ = nullptr;
    std::optional<focus::FocusId> currentFocusId_;
};

} // namespace hearth::layout
