#include "hearth/layout/LayoutGrid.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

namespace hearth::layout
{
namespace
{
double Fraction(int offset, std::size_t extent) noexcept
{
    if (extent <= 1)
    {
        return 0.0;
    }
    const int clamped = std::clamp(offset, 0, static_cast<int>(extent) - 1);
    return static_cast<double>(clamped) / static_cast<double>(extent - 1);
}

int ScaleFraction(double fraction, std::size_t extent) noexcept
{
    if (extent <= 1)
    {
        return 0;
    }
    return static_cast<int>(std::lround(fraction * static_cast<double>(extent - 1)));
}
} // namespace

Point DirectionVector(Direction direction) noexcept
{
    switch (direction)
    {
    case Direction::Up:
        return Point{0, -1};
    case Direction::Down:
        return Point{0, 1};
    case Direction::Left:
        return Point{-1, 0};
    case Direction::Right:
        return Point{1, 0};
    }
    return Point{};
}

std::pair<Point, Point> SideVectors(Direction direction) noexcept
{
    switch (direction)
    {
    case Direction::Up:
    case Direction::Down:
        return {Point{-1, 0}, Point{1, 0}};
    case Direction::Left:
    case Direction::Right:
        return {Point{0, -1}, Point{0, 1}};
    }
    return {};
}

LayoutGrid::LayoutGrid(std::size_t width, std::size_t height, LayoutId id)
    : id_{std::move(id)}
    , grid_{width, height}
    , initialWidth_{width}
    , initialHeight_{height}
{
}

LayoutGrid::~LayoutGrid() = default;

LayoutGrid& LayoutGrid::AddElement(const Rect& rect, focus::FocusId focusId)
{
    if (grow_.has_value())
    {
        throw std::logic_error(
            "Layout " + id_ + " is growable; elements must be inserted with InsertGrowable.");
    }

    GridItem item;
    item.kind = GridItem::Kind::Element;
    item.focusId = std::move(focusId);
    item.rect = rect;
    PushItem(std::move(item));
    return *this;
}

LayoutGrid& LayoutGrid::AddSublayout(const Rect& rect, LayoutId id, std::size_t width, std::size_t height)
{
    if (grow_.has_value())
    {
        throw std::logic_error("Layout " + id_ + " is growable and cannot hold sublayouts.");
    }
    if (sublayoutItems_.contains(id))
    {
        throw std::invalid_argument("Layout " + id_ + " already holds a sublayout named " + id + ".");
    }

    auto child = std::make_unique<LayoutGrid>(width, height, id);
    child->parent_ = this;

    GridItem item;
    item.kind = GridItem::Kind::Sublayout;
    item.rect = rect;
    item.sublayout = child.get();
    const ItemIndex index = PushItem(std::move(item));

    sublayoutItems_.emplace(id, index);
    children_.push_back(std::move(child));
    return *children_.back();
}

void LayoutGrid::MapSpecialButton(SpecialButton button, SpecialAction action)
{
    specialHandlers_[button] = action;
}

void LayoutGrid::SetGrowable(GrowConfig config)
{
    if (!items_.empty())
    {
        throw std::logic_error("Cannot make layout " + id_ + " growable once items are added.");
    }
    if (config.itemWidth == 0 || config.itemHeight == 0)
    {
        throw std::invalid_argument("Growable items need a non-zero size.");
    }
    if (config.direction == GrowDirection::GrowX && config.itemWidth > grid_.Width())
    {
        throw std::invalid_argument("Growable item is wider than layout " + id_ + ".");
    }
    if (config.direction == GrowDirection::GrowY && config.itemHeight > grid_.Height())
    {
        throw std::invalid_argument("Growable item is taller than layout " + id_ + ".");
    }

    grow_ = config;
    growCursor_ = Point{};
}

void LayoutGrid::InsertGrowable(focus::FocusId focusId)
{
    if (!grow_.has_value())
    {
        throw std::logic_error("No grow config set for layout " + id_ + ".");
    }

    const GrowConfig& config = *grow_;
    const auto cursorX = static_cast<std::size_t>(growCursor_.x);
    const auto cursorY = static_cast<std::size_t>(growCursor_.y);

    std::size_t startX = cursorX;
    std::size_t startY = cursorY;
    if (config.direction == GrowDirection::GrowX)
    {
        if (startX + config.itemWidth > grid_.Width())
        {
            startX = 0;
            startY += config.itemHeight;
        }
        if (startY + config.itemHeight > grid_.Height())
        {
            grid_.Expand(grid_.Width(), startY + config.itemHeight);
        }
    }
    else
    {
        if (startY + config.itemHeight > grid_.Height())
        {
            startY = 0;
            startX += config.itemWidth;
        }
        if (startX + config.itemWidth > grid_.Width())
        {
            grid_.Expand(startX + config.itemWidth, grid_.Height());
        }
    }

    GridItem item;
    item.kind = GridItem::Kind::Element;
    item.focusId = std::move(focusId);
    item.rect = Rect{startX, startX + config.itemWidth - 1, startY, startY + config.itemHeight - 1};
    PushItem(std::move(item));

    if (config.direction == GrowDirection::GrowX)
    {
        growCursor_ = Point{static_cast<int>(startX + config.itemWidth), static_cast<int>(startY)};
    }
    else
    {
        growCursor_ = Point{static_cast<int>(startX), static_cast<int>(startY + config.itemHeight)};
    }
}

void LayoutGrid::ClearGrowable()
{
    if (!grow_.has_value())
    {
        throw std::logic_error("No grow config set for layout " + id_ + ".");
    }

    items_.clear();
    grid_.Reset(initialWidth_, initialHeight_);
    growCursor_ = Point{};
    state_.reset();
}

LayoutGrid* LayoutGrid::FindSublayout(std::string_view id) noexcept
{
    for (const auto& child : children_)
    {
        if (child->id_ == id)
        {
            return child.get();
        }
        if (LayoutGrid* nested = child->FindSublayout(id); nested != nullptr)
        {
            return nested;
        }
    }
    return nullptr;
}

LayoutGrid* LayoutGrid::FindElementOwner(std::string_view focusId) noexcept
{
    if (ElementRect(focusId).has_value())
    {
        return this;
    }
    for (const auto& child : children_)
    {
        if (LayoutGrid* owner = child->FindElementOwner(focusId); owner != nullptr)
        {
            return owner;
        }
    }
    return nullptr;
}

std::optional<Rect> LayoutGrid::ElementRect(std::string_view focusId) const
{
    for (const auto& item : items_)
    {
        if (item.kind == GridItem::Kind::Element && item.focusId == focusId)
        {
            return item.rect;
        }
    }
    return std::nullopt;
}

std::size_t LayoutGrid::ElementCount() const noexcept
{
    return static_cast<std::size_t>(std::count_if(items_.begin(), items_.end(), [](const GridItem& item) {
        return item.kind == GridItem::Kind::Element;
    }));
}

void LayoutGrid::SetPoint(std::size_t x, std::size_t y)
{
    if (x >= grid_.Width() || y >= grid_.Height())
    {
        throw std::out_of_range(
            "Point " + std::to_string(x) + "," + std::to_string(y) + " is outside of layout " + id_ + ".");
    }
    state_ = Point{static_cast<int>(x), static_cast<int>(y)};
}

std::optional<focus::FocusId> LayoutGrid::CurrentFocusId() const
{
    const GridItem* item = CurrentItem();
    if (item == nullptr || item->kind != GridItem::Kind::Element)
    {
        return std::nullopt;
    }
    return item->focusId;
}

NavigationResult LayoutGrid::Navigate(const NavigationDirective& directive)
{
    std::optional<Hit> hit;
    switch (directive.kind)
    {
    case NavigationDirective::Kind::Noop:
        if (auto current = CurrentFocusId())
        {
            hit = Hit{std::move(*current), this};
        }
        break;
    case NavigationDirective::Kind::Button:
        if (const auto it = specialHandlers_.find(directive.button); it != specialHandlers_.end())
        {
            hit = JumpToEdge(it->second);
        }
        else
        {
            // Unmapped shoulder buttons behave like the matching direction.
            hit = Move(directive.button == SpecialButton::ShoulderLeft ? Direction::Left : Direction::Right);
        }
        break;
    case NavigationDirective::Kind::Move:
        hit = Move(directive.direction);
        break;
    }

    NavigationResult result;
    if (!hit.has_value())
    {
        return result;
    }

    result.kind = hit->layout == this ? NavigationResult::Kind::WithinLayout : NavigationResult::Kind::AcrossLayout;
    result.focusId = std::move(hit->focusId);
    result.layout = hit->layout;
    return result;
}

const LayoutGrid::GridItem* LayoutGrid::ItemAt(const Point& point) const
{
    if (!grid_.Contains(point))
    {
        return nullptr;
    }
    const auto& cell = grid_.At(point);
    return cell.has_value() ? &items_[*cell] : nullptr;
}

const LayoutGrid::GridItem* LayoutGrid::CurrentItem() const
{
    return state_.has_value() ? ItemAt(*state_) : nullptr;
}

Point LayoutGrid::CurrentCorner(Direction direction) const
{
    if (const GridItem* item = CurrentItem(); item != nullptr && item->kind == GridItem::Kind::Element)
    {
        return direction == Direction::Up || direction == Direction::Left ? item->rect.TopLeft()
                                                                          : item->rect.BottomRight();
    }

    if (state_.has_value())
    {
        return *state_;
    }

    // No position yet: start just outside the edge the move comes from.
    switch (direction)
    {
    case Direction::Up:
        return Point{0, static_cast<int>(grid_.Height())};
    case Direction::Down:
        return Point{0, -1};
    case Direction::Left:
        return Point{static_cast<int>(grid_.Width()), 0};
    case Direction::Right:
        return Point{-1, 0};
    }
    return Point{};
}

std::optional<LayoutGrid::Hit> LayoutGrid::Move(Direction direction)
{
    const Point corner = CurrentCorner(direction);
    if (!grid_.Contains(corner.Offset(DirectionVector(direction))))
    {
        return TryNavigateOut(corner, direction);
    }
    return Search(corner, direction, false);
}

std::optional<LayoutGrid::Hit> LayoutGrid::JumpToEdge(SpecialAction action)
{
    switch (action)
    {
    case SpecialAction::NavigateOutLeft:
        return Search(Point{0, 0}, Direction::Right, true);
    case SpecialAction::NavigateOutRight:
        return Search(Point{static_cast<int>(grid_.Width()) - 1, 0}, Direction::Left, true);
    }
    return std::nullopt;
}

std::optional<LayoutGrid::Hit> LayoutGrid::Search(const Point& corner, Direction direction, bool includeCorner)
{
    const Point step = DirectionVector(direction);
    const Point start = includeCorner ? corner : corner.Offset(step);
    std::vector<const LayoutGrid*> exhausted;

    // Straight line first.
    for (Point point = start; grid_.Contains(point); point = point.Offset(step))
    {
        if (auto hit = TryNavigateToPoint(point, direction, exhausted))
        {
            return hit;
        }
    }

    // Then sideways on every line ahead, nearest cell first. Sideways scans
    // never enter a sublayout.
    const auto [sideA, sideB] = SideVectors(direction);
    for (Point point = start; grid_.Contains(point); point = point.Offset(step))
    {
        std::array<bool, 2> blocked{false, false};
        const std::array<Point, 2> sides{sideA, sideB};
        for (int distance = 1; !blocked[0] || !blocked[1]; ++distance)
        {
            for (std::size_t side = 0; side < sides.size(); ++side)
            {
                if (blocked[side])
                {
                    continue;
                }

                const Point candidate = point.Offset(sides[side].Scaled(distance));
                const GridItem* item = ItemAt(candidate);
                if (!grid_.Contains(candidate) || (item != nullptr && item->kind == GridItem::Kind::Sublayout))
                {
                    blocked[side] = true;
                    continue;
                }

                if (auto hit = TryNavigateToPoint(candidate, direction, exhausted))
                {
                    return hit;
                }
            }
        }
    }

    return std::nullopt;
}

std::optional<LayoutGrid::Hit> LayoutGrid::TryNavigateToPoint(
    const Point& point,
    Direction direction,
    std::vector<const LayoutGrid*>& exhausted)
{
    const GridItem* item = ItemAt(point);
    if (item == nullptr)
    {
        return std::nullopt;
    }

    if (item->kind == GridItem::Kind::Element)
    {
        state_ = point;
        return Hit{item->focusId, this};
    }

    LayoutGrid* child = item->sublayout;
    if (std::find(exhausted.begin(), exhausted.end(), child) != exhausted.end())
    {
        return std::nullopt;
    }

    const double fractionX = Fraction(point.x - static_cast<int>(item->rect.XStart()), item->rect.Width());
    const double fractionY = Fraction(point.y - static_cast<int>(item->rect.YStart()), item->rect.Height());
    auto hit = child->EnterFromParent(fractionX, fractionY, direction);
    if (!hit.has_value())
    {
        exhausted.push_back(child);
        return std::nullopt;
    }

    state_ = point;
    return hit;
}

std::optional<LayoutGrid::Hit> LayoutGrid::TryNavigateOut(const Point& corner, Direction direction)
{
    if (parent_ == nullptr)
    {
        return std::nullopt;
    }
    return parent_->ReturnFromChild(*this, corner, direction);
}

std::optional<LayoutGrid::Hit> LayoutGrid::EnterFromParent(double fractionX, double fractionY, Direction direction)
{
    const Point entry{ScaleFraction(fractionX, grid_.Width()), ScaleFraction(fractionY, grid_.Height())};
    return Search(entry, direction, true);
}

std::optional<LayoutGrid::Hit> LayoutGrid::ReturnFromChild(const LayoutGrid& child, const Point& exit, Direction direction)
{
    const auto it = sublayoutItems_.find(child.Id());
    if (it == sublayoutItems_.end())
    {
        throw std::logic_error("Layout " + child.Id() + " is not a sublayout of " + id_ + ".");
    }

    const Rect& rect = items_[it->second].rect;
    Point edge{
        static_cast<int>(rect.XStart()) + ScaleFraction(Fraction(exit.x, child.Width()), rect.Width()),
        static_cast<int>(rect.YStart()) + ScaleFraction(Fraction(exit.y, child.Height()), rect.Height())};

    // Leave from the side of the sublayout the move points at.
    switch (direction)
    {
    case Direction::Up:
        edge.y = static_cast<int>(rect.YStart());
        break;
    case Direction::Down:
        edge.y = static_cast<int>(rect.YEnd());
        break;
    case Direction::Left:
        edge.x = static_cast<int>(rect.XStart());
        break;
    case Direction::Right:
        edge.x = static_cast<int>(rect.XEnd());
        break;
    }

    if (!grid_.Contains(edge.Offset(DirectionVector(direction))))
    {
        return TryNavigateOut(edge, direction);
    }
    return Search(edge, direction, false);
}

LayoutGrid::ItemIndex LayoutGrid::PushItem(GridItem item)
{
    const ItemIndex index = items_.size();
    grid_.Fill(item.rect, index);
    items_.push_back(std::move(item));
    return index;
}

} // namespace hearth::layout
