#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "hearth/layout/GridLayout.hpp"

#include <set>
#include <stdexcept>
#include <utility>

using namespace hearth::layout;

TEST_CASE("Default configuration is seven columns, three visible rows and 100 padding")
{
    const GridLayoutConfig config;
    CHECK(config.columns == 7);
    CHECK(config.visibleRows == 3);
    CHECK(config.contentPadding == doctest::Approx(100.0f));
}

TEST_CASE("Degenerate configurations are rejected")
{
    CHECK_THROWS_AS(GridLayout(GridLayoutConfig{0, 3, 100.0f}), std::invalid_argument);
    CHECK_THROWS_AS(GridLayout(GridLayoutConfig{7, 0, 100.0f}), std::invalid_argument);
    CHECK_THROWS_AS(GridLayout(GridLayoutConfig{7, 3, -1.0f}), std::invalid_argument);
    CHECK_NOTHROW(GridLayout(GridLayoutConfig{1, 1, 0.0f}));
}

TEST_CASE("Twenty seven games over seven columns take four rows")
{
    const GridLayout layout;
    const auto result = layout.Compute(27, 1400.0f, 900.0f);

    CHECK(result.rowCount == 4);
    CHECK(result.itemWidth == doctest::Approx(200.0f));
    CHECK(result.itemHeight == doctest::Approx(300.0f));
    CHECK(result.contentHeight == doctest::Approx(4 * 300.0f + 100.0f));
    REQUIRE(result.tiles.size() == 27);

    const auto& last = result.tiles[26];
    CHECK(last.cell == GridCell{3, 5});
    CHECK(last.x == doctest::Approx(1000.0f));
    CHECK(last.y == doctest::Approx(900.0f));
}

TEST_CASE("Tiles are laid out row by row")
{
    const GridLayout layout;
    CHECK(layout.CellFor(0) == GridCell{0, 0});
    CHECK(layout.CellFor(6) == GridCell{0, 6});
    CHECK(layout.CellFor(7) == GridCell{1, 0});
    CHECK(layout.CellFor(15) == GridCell{2, 1});
}

TEST_CASE("An empty list yields only the padding")
{
    const GridLayout layout;
    const auto result = layout.Compute(0, 1400.0f, 900.0f);
    CHECK(result.rowCount == 0);
    CHECK(result.tiles.empty());
    CHECK(result.contentHeight == doctest::Approx(100.0f));
}

TEST_CASE("A partially filled row still counts as a row")
{
    const GridLayout layout;
    CHECK(layout.RowCount(1) == 1);
    CHECK(layout.RowCount(7) == 1);
    CHECK(layout.RowCount(8) == 2);
}

TEST_CASE("Row height does not depend on the item count")
{
    const GridLayout layout;
    CHECK(layout.Compute(1, 700.0f, 600.0f).itemHeight == doctest::Approx(200.0f));
    CHECK(layout.Compute(100, 700.0f, 600.0f).itemHeight == doctest::Approx(200.0f));
}

TEST_CASE("Custom column counts change the tile width")
{
    const GridLayout layout{GridLayoutConfig{4, 2, 0.0f}};
    const auto result = layout.Compute(5, 800.0f, 400.0f);
    CHECK(result.itemWidth == doctest::Approx(200.0f));
    CHECK(result.itemHeight == doctest::Approx(200.0f));
    CHECK(result.rowCount == 2);
    CHECK(result.contentHeight == doctest::Approx(400.0f));
    CHECK(result.tiles[4].cell == GridCell{1, 0});
}

TEST_CASE("Compute is deterministic")
{
    const GridLayout layout;
    CHECK(layout.Compute(13, 1280.0f, 720.0f) == layout.Compute(13, 1280.0f, 720.0f));
}

TEST_CASE("Negative viewport sizes clamp to zero sized tiles")
{
    const GridLayout layout;
    const auto result = layout.Compute(3, -10.0f, -10.0f);
    CHECK(result.itemWidth == doctest::Approx(0.0f));
    CHECK(result.itemHeight == doctest::Approx(0.0f));
    CHECK(result.contentHeight == doctest::Approx(100.0f));
}

TEST_CASE("Every item gets its own cell and the content covers the last row")
{
    for (std::size_t columns = 1; columns <= 9; ++columns)
    {
        const GridLayout layout{GridLayoutConfig{columns, 3, 100.0f}};
        for (std::size_t count = 0; count <= 60; ++count)
        {
            CAPTURE(columns);
            CAPTURE(count);
            const auto result = layout.Compute(count, 900.0f, 600.0f);
            REQUIRE(result.tiles.size() == count);

            std::set<std::pair<std::size_t, std::size_t>> cells;
            for (const auto& tile : result.tiles)
            {
                CHECK(tile.cell.column < columns);
                CHECK(cells.emplace(tile.cell.row, tile.cell.column).second);
            }

            if (count > 0)
            {
                const auto lastRow = static_cast<float>((count - 1) / columns + 1);
                CHECK(result.contentHeight >= lastRow * result.itemHeight);
            }
        }
    }
}
