#pragma once

#include "hearth/focus/FocusId.hpp"
#include "hearth/layout/Grid2D.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hearth::layout
{

using LayoutId = std::string;

enum class Direction
{
    Up,
    Down,
    Left,
    Right,
};

enum class SpecialButton
{
    ShoulderLeft,
    ShoulderRight,
};

enum class SpecialAction
{
    NavigateOutLeft,
    NavigateOutRight,
};

enum class GrowDirection
{
    //! Fill left to right, starting a new row when the current one is full.
    GrowX,
    //! Fill top to bottom, starting a new column when the current one is full.
    GrowY,
};

struct GrowConfig
{
    std::size_t itemWidth = 1;
    std::size_t itemHeight = 1;
    GrowDirection direction = GrowDirection::GrowX;
};

[[nodiscard]] Point DirectionVector(Direction direction) noexcept;
[[nodiscard]] std::pair<Point, Point> SideVectors(Direction direction) noexcept;

struct NavigationDirective
{
    enum class Kind
    {
        Noop,
        Move,
        Button,
    };

    Kind kind = Kind::Noop;
    Direction direction = Direction::Up;
    SpecialButton button = SpecialButton::ShoulderLeft;

    static NavigationDirective Noop() noexcept { return NavigationDirective{}; }
    static NavigationDirective Move(Direction direction) noexcept
    {
        NavigationDirective directive;
        directive.kind = Kind::Move;
        directive.direction = direction;
        return directive;
    }
    static NavigationDirective Press(SpecialButton button) noexcept
    {
        NavigationDirective directive;
        directive.kind = Kind::Button;
        directive.button = button;
        return directive;
    }
};

class LayoutGrid;

struct NavigationResult
{
    enum class Kind
    {
        WithinLayout,
        AcrossLayout,
        NoNextItem,
    };

    Kind kind = Kind::NoNextItem;
    focus::FocusId focusId;
    //! Layout that owns the focused element; null for NoNextItem.
    LayoutGrid* layout = nullptr;
};

//! A navigation grid. Cells hold focusable elements or nested sub-layouts,
//! and directional moves search the grid for the next element to focus.
//! Sub-layouts are owned by their parent and keep a back pointer to it, so a
//! LayoutGrid is neither copyable nor movable.
class LayoutGrid
{
  public:
    LayoutGrid(std::size_t width, std::size_t height, LayoutId id);
    ~LayoutGrid();

    LayoutGrid(const LayoutGrid&) = delete;
    LayoutGrid& operator=(const LayoutGrid&) = delete;
    LayoutGrid(LayoutGrid&&) = delete;
    LayoutGrid& operator=(LayoutGrid&&) = delete;

    [[nodiscard]] const LayoutId& Id() const noexcept { return id_; }
    [[nodiscard]] std::size_t Width() const noexcept { return grid_.Width(); }
    [[nodiscard]] std::size_t Height() const noexcept { return grid_.Height(); }
    [[nodiscard]] LayoutGrid* Parent() const noexcept { return parent_; }

    LayoutGrid& AddElement(const Rect& rect, focus::FocusId focusId);
    LayoutGrid& AddSublayout(const Rect& rect, LayoutId id, std::size_t width, std::size_t height);
    void MapSpecialButton(SpecialButton button, SpecialAction action);

    void SetGrowable(GrowConfig config);
    [[nodiscard]] bool IsGrowable() const noexcept { return grow_.has_value(); }
    void InsertGrowable(focus::FocusId focusId);
    void ClearGrowable();

    [[nodiscard]] LayoutGrid* FindSublayout(std::string_view id) noexcept;
    [[nodiscard]] LayoutGrid* FindElementOwner(std::string_view focusId) noexcept;
    [[nodiscard]] std::optional<Rect> ElementRect(std::string_view focusId) const;
    [[nodiscard]] std::size_t ElementCount() const noexcept;

    void SetPoint(std::size_t x, std::size_t y);
    [[nodiscard]] std::optional<Point> CurrentPoint() const noexcept { return state_; }
    [[nodiscard]] std::optional<focus::FocusId> CurrentFocusId() const;

    NavigationResult Navigate(const NavigationDirective& directive);

  private:
    struct GridItem
    {
        enum class Kind
        {
            Element,
            Sublayout,
        };

        Kind kind = Kind::Element;
        focus::FocusId focusId;
        Rect rect;
        LayoutGrid* sublayout = nullptr;
    };

    struct Hit
    {
        focus::FocusId focusId;
        LayoutGrid* layout = nullptr;
    };

    using ItemIndex = std::size_t;

    [[nodiscard]] const GridItem* ItemAt(const Point& point) const;
    [[nodiscard]] const GridItem* CurrentItem() const;
    [[nodiscard]] Point CurrentCorner(Direction direction) const;

    std::optional<Hit> Move(Direction direction);
    std::optional<Hit> JumpToEdge(SpecialAction action);
    std::optional<Hit> Search(const Point& corner, Direction direction, bool includeCorner);
    std::optional<Hit> TryNavigateToPoint(const Point& point, Direction direction, std::vector<const LayoutGrid*>& exhausted);
    std::optional<Hit> TryNavigateOut(const Point& corner, Direction direction);
    std::optional<Hit> EnterFromParent(double fractionX, double fractionY, Direction direction);
    std::optional<Hit> ReturnFromChild(const LayoutGrid& child, const Point& exit, Direction direction);

    ItemIndex PushItem(GridItem item);

    LayoutId id_;
    Grid2D<ItemIndex> grid_;
    std::size_t initialWidth_;
    std::size_t initialHeight_;
    std::vector<GridItem> items_;
    std::vector<std::unique_ptr<LayoutGrid>> children_;
    std::unordered_map<LayoutId, ItemIndex> sublayoutItems_;
    std::unordered_map<SpecialButton, SpecialAction> specialHandlers_;
    std::optional<Point> state_;
    std::optional<GrowConfig> grow_;
    Point growCursor_{};
    LayoutGrid* parent_ = nullptr;
};

} // namespace hearth::layout
