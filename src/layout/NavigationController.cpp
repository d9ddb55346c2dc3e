#include "hearth/layout/NavigationController.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace hearth::layout
{

NavigationController::NavigationController(std::unique_ptr<LayoutGrid> root)
    : root_{std::move(root)}
{
    if (!root_)
    {
        throw std::invalid_argument("NavigationController requires a root layout.");
    }

    ResetToRoot();
    if (!currentFocusId_.has_value())
    {
        throw std::runtime_error("Root layout " + root_->Id() + " requires a focusable element at (0, 0).");
    }
}

NavigationResult NavigationController::Navigate(const NavigationDirective& directive)
{
    NavigationResult result = current_->Navigate(directive);
    if (result.kind != NavigationResult::Kind::NoNextItem)
    {
        current_ = result.layout;
        currentFocusId_ = result.focusId;
    }
    return result;
}

bool NavigationController::FocusById(std::string_view focusId)
{
    LayoutGrid* owner = root_->FindElementOwner(focusId);
    if (owner == nullptr)
    {
        return false;
    }

    const auto rect = owner->ElementRect(focusId);
    owner->SetPoint(rect->XStart(), rect->YStart());
    current_ = owner;
    currentFocusId_ = focus::FocusId{focusId};
    return true;
}

void NavigationController::InsertElement(std::string_view layoutId, focus::FocusId focusId)
{
    RequireLayout(layoutId).InsertGrowable(std::move(focusId));
}

void NavigationController::ClearLayout(std::string_view layoutId)
{
    LayoutGrid& layout = RequireLayout(layoutId);
    layout.ClearGrowable();

    for (const LayoutGrid* cursor = current_; cursor != nullptr; cursor = cursor->Parent())
    {
        if (cursor == &layout)
        {
            ResetToRoot();
            break;
        }
    }
}

LayoutGrid* NavigationController::FindLayout(std::string_view layoutId) noexcept
{
    if (root_->Id() == layoutId)
    {
        return root_.get();
    }
    return root_->FindSublayout(layoutId);
}

LayoutGrid& NavigationController::RequireLayout(std::string_view layoutId)
{
    LayoutGrid* layout = FindLayout(layoutId);
    if (layout == nullptr)
    {
        throw std::invalid_argument("No layout " + std::string{layoutId} + " found.");
    }
    return *layout;
}

void NavigationController::ResetToRoot()
{
    current_ = root_.get();
    root_->SetPoint(0, 0);
    currentFocusId_ = root_->CurrentFocusId();
}

} // namespace hearth::layout
