#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "hearth/layout/Grid2D.hpp"
#include "hearth/layout/LayoutGrid.hpp"

#include <stdexcept>

using namespace hearth::layout;

TEST_CASE("Rect rejects an end before its start")
{
    CHECK_THROWS_AS(Rect(2, 1, 0, 0), std::invalid_argument);
    CHECK_THROWS_AS(Rect(0, 0, 3, 2), std::invalid_argument);

    const Rect rect{1, 3, 2, 2};
    CHECK(rect.Width() == 3);
    CHECK(rect.Height() == 1);
    CHECK(rect.Contains(Point{3, 2}));
    CHECK_FALSE(rect.Contains(Point{4, 2}));
}

TEST_CASE("Grid2D fill rejects out of bounds and overlapping rects")
{
    Grid2D<int> grid{3, 2};
    grid.Fill(Rect{0, 1, 0, 0}, 7);
    CHECK(grid.At(1, 0) == 7);
    CHECK_FALSE(grid.At(2, 0).has_value());

    CHECK_THROWS_AS(grid.Fill(Rect{1, 2, 0, 1}, 8), std::invalid_argument);
    CHECK_FALSE(grid.At(2, 1).has_value());
    CHECK_THROWS_AS(grid.Fill(Rect{2, 3, 0, 0}, 9), std::out_of_range);
    CHECK_THROWS_AS((void)grid.At(3, 0), std::out_of_range);
    CHECK_THROWS_AS((void)grid.At(Point{-1, 0}), std::out_of_range);
}

TEST_CASE("Grid2D only grows")
{
    CHECK_THROWS_AS(Grid2D<int>(0, 1), std::invalid_argument);

    Grid2D<int> grid{2, 2};
    grid.Fill(Rect{1, 1, 1, 1}, 4);
    grid.Expand(3, 4);
    CHECK(grid.Width() == 3);
    CHECK(grid.Height() == 4);
    CHECK(grid.At(1, 1) == 4);
    CHECK_FALSE(grid.At(2, 3).has_value());
    CHECK_THROWS_AS(grid.Expand(2, 4), std::invalid_argument);
    CHECK_THROWS_AS(grid.Expand(3, 3), std::invalid_argument);
}

TEST_CASE("Moves skip empty cells and stop at the edge")
{
    LayoutGrid layout{4, 1, "Row"};
    layout.AddElement(Rect{0, 0, 0, 0}, "A").AddElement(Rect{3, 3, 0, 0}, "B");
    layout.SetPoint(0, 0);

    auto result = layout.Navigate(NavigationDirective::Move(Direction::Right));
    CHECK(result.kind == NavigationResult::Kind::WithinLayout);
    CHECK(result.focusId == "B");
    CHECK(result.layout == &layout);

    result = layout.Navigate(NavigationDirective::Move(Direction::Right));
    CHECK(result.kind == NavigationResult::Kind::NoNextItem);
    CHECK(layout.CurrentFocusId() == "B");
}

TEST_CASE("Moves scan sideways nearest first when the line is empty")
{
    LayoutGrid layout{5, 2, "Sideways"};
    layout.AddElement(Rect{2, 2, 0, 0}, "Top")
        .AddElement(Rect{0, 0, 1, 1}, "FarLeft")
        .AddElement(Rect{3, 3, 1, 1}, "NearRight");
    layout.SetPoint(2, 0);

    const auto result = layout.Navigate(NavigationDirective::Move(Direction::Down));
    CHECK(result.focusId == "NearRight");
}

TEST_CASE("Wide elements navigate from their far edge")
{
    LayoutGrid layout{3, 2, "Wide"};
    layout.AddElement(Rect{0, 1, 0, 0}, "Wide").AddElement(Rect{2, 2, 0, 0}, "Right").AddElement(Rect{1, 1, 1, 1}, "Below");
    layout.SetPoint(0, 0);

    CHECK(layout.Navigate(NavigationDirective::Move(Direction::Right)).focusId == "Right");
    CHECK(layout.Navigate(NavigationDirective::Move(Direction::Left)).focusId == "Wide");
    CHECK(layout.Navigate(NavigationDirective::Move(Direction::Down)).focusId == "Below");
}

TEST_CASE("Noop reports the current element")
{
    LayoutGrid layout{1, 1, "Single"};
    layout.AddElement(Rect{0, 0, 0, 0}, "Only");
    CHECK(layout.Navigate(NavigationDirective::Noop()).kind == NavigationResult::Kind::NoNextItem);

    layout.SetPoint(0, 0);
    const auto result = layout.Navigate(NavigationDirective::Noop());
    CHECK(result.kind == NavigationResult::Kind::WithinLayout);
    CHECK(result.focusId == "Only");
}

TEST_CASE("Entering a sublayout lands at the proportional point")
{
    LayoutGrid root{3, 2, "Root"};
    root.AddElement(Rect{0, 0, 0, 0}, "Left").AddElement(Rect{2, 2, 0, 0}, "Right");
    LayoutGrid& child = root.AddSublayout(Rect{0, 2, 1, 1}, "Child", 5, 1);
    child.AddElement(Rect{0, 0, 0, 0}, "C0").AddElement(Rect{2, 2, 0, 0}, "C2").AddElement(Rect{4, 4, 0, 0}, "C4");

    root.SetPoint(2, 0);
    const auto result = root.Navigate(NavigationDirective::Move(Direction::Down));
    CHECK(result.kind == NavigationResult::Kind::AcrossLayout);
    CHECK(result.focusId == "C4");
    CHECK(result.layout == &child);
}

TEST_CASE("Leaving a sublayout returns to the parent at the proportional point")
{
    LayoutGrid root{3, 2, "Root"};
    root.AddElement(Rect{0, 0, 0, 0}, "Left").AddElement(Rect{2, 2, 0, 0}, "Right");
    LayoutGrid& child = root.AddSublayout(Rect{0, 2, 1, 1}, "Child", 5, 1);
    child.AddElement(Rect{4, 4, 0, 0}, "C4");

    child.SetPoint(4, 0);
    const auto result = child.Navigate(NavigationDirective::Move(Direction::Up));
    CHECK(result.kind == NavigationResult::Kind::AcrossLayout);
    CHECK(result.focusId == "Right");
    CHECK(result.layout == &root);
}

TEST_CASE("Sideways scans never enter a sublayout")
{
    LayoutGrid root{3, 2, "Root"};
    root.AddElement(Rect{0, 0, 0, 0}, "Start");
    LayoutGrid& child = root.AddSublayout(Rect{1, 1, 0, 1}, "Child", 1, 1);
    child.AddElement(Rect{0, 0, 0, 0}, "Inside");
    root.AddElement(Rect{2, 2, 1, 1}, "Beyond");

    root.SetPoint(0, 0);
    const auto result = root.Navigate(NavigationDirective::Move(Direction::Down));
    CHECK(result.kind == NavigationResult::Kind::NoNextItem);
}

TEST_CASE("An empty sublayout is skipped")
{
    LayoutGrid root{1, 3, "Root"};
    root.AddElement(Rect{0, 0, 0, 0}, "Top").AddElement(Rect{0, 0, 2, 2}, "Bottom");
    root.AddSublayout(Rect{0, 0, 1, 1}, "Empty", 2, 2);

    root.SetPoint(0, 0);
    CHECK(root.Navigate(NavigationDirective::Move(Direction::Down)).focusId == "Bottom");
}

TEST_CASE("Growable layouts place items in order and expand")
{
    LayoutGrid layout{3, 1, "Grow"};
    layout.SetGrowable(GrowConfig{1, 1, GrowDirection::GrowX});
    for (const char* id : {"a", "b", "c", "d"})
    {
        layout.InsertGrowable(id);
    }

    CHECK(layout.Height() == 2);
    CHECK(layout.ElementRect("c") == Rect{2, 2, 0, 0});
    CHECK(layout.ElementRect("d") == Rect{0, 0, 1, 1});
    CHECK(layout.ElementCount() == 4);

    layout.ClearGrowable();
    CHECK(layout.ElementCount() == 0);
    CHECK(layout.Height() == 1);
    layout.InsertGrowable("e");
    CHECK(layout.ElementRect("e") == Rect{0, 0, 0, 0});
}

TEST_CASE("Vertical growth fills columns")
{
    LayoutGrid layout{1, 2, "Column"};
    layout.SetGrowable(GrowConfig{1, 1, GrowDirection::GrowY});
    layout.InsertGrowable("a");
    layout.InsertGrowable("b");
    layout.InsertGrowable("c");
    CHECK(layout.Width() == 2);
    CHECK(layout.ElementRect("c") == Rect{1, 1, 0, 0});
}

TEST_CASE("Growable layouts refuse static content")
{
    LayoutGrid layout{2, 2, "Grow"};
    layout.SetGrowable(GrowConfig{});
    CHECK_THROWS_AS(layout.AddElement(Rect{0, 0, 0, 0}, "x"), std::logic_error);
    CHECK_THROWS_AS(layout.AddSublayout(Rect{0, 0, 0, 0}, "y", 1, 1), std::logic_error);

    LayoutGrid fixed{2, 2, "Fixed"};
    CHECK_THROWS_AS(fixed.InsertGrowable("z"), std::logic_error);
    CHECK_THROWS_AS(fixed.SetPoint(2, 0), std::out_of_range);
}

TEST_CASE("Mapped shoulder buttons jump to the edges of the layout")
{
    LayoutGrid layout{5, 2, "Shelf"};
    layout.SetGrowable(GrowConfig{});
    layout.MapSpecialButton(SpecialButton::ShoulderLeft, SpecialAction::NavigateOutLeft);
    layout.MapSpecialButton(SpecialButton::ShoulderRight, SpecialAction::NavigateOutRight);
    for (const char* id : {"a", "b", "c"})
    {
        layout.InsertGrowable(id);
    }
    layout.SetPoint(1, 0);

    CHECK(layout.Navigate(NavigationDirective::Press(SpecialButton::ShoulderRight)).focusId == "c");
    CHECK(layout.Navigate(NavigationDirective::Press(SpecialButton::ShoulderLeft)).focusId == "a");
}

TEST_CASE("Unmapped shoulder buttons move sideways")
{
    LayoutGrid layout{2, 1, "Pair"};
    layout.AddElement(Rect{0, 0, 0, 0}, "L").AddElement(Rect{1, 1, 0, 0}, "R");
    layout.SetPoint(0, 0);

    CHECK(layout.Navigate(NavigationDirective::Press(SpecialButton::ShoulderRight)).focusId == "R");
    CHECK(layout.Navigate(NavigationDirective::Press(SpecialButton::ShoulderLeft)).focusId == "L");
}

TEST_CASE("Sublayout lookups are recursive")
{
    LayoutGrid root{2, 2, "Root"};
    LayoutGrid& outer = root.AddSublayout(Rect{0, 1, 0, 1}, "Outer", 2, 2);
    LayoutGrid& inner = outer.AddSublayout(Rect{1, 1, 1, 1}, "Inner", 1, 1);
    inner.AddElement(Rect{0, 0, 0, 0}, "Deep");

    CHECK(root.FindSublayout("Inner") == &inner);
    CHECK(root.FindElementOwner("Deep") == &inner);
    CHECK(root.FindElementOwner("Missing") == nullptr);
    CHECK(inner.Parent() == &outer);
    CHECK_THROWS_AS(root.AddSublayout(Rect{0, 0, 0, 0}, "Outer", 1, 1), std::invalid_argument);
}
