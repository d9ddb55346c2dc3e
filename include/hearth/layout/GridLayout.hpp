#pragma once

#include <cstddef>
#include <vector>

namespace hearth::layout
{

struct GridLayoutConfig
{
    std::size_t columns = 7;
    std::size_t visibleRows = 3;
    float contentPadding = 100.0f;
};

//! Throws std::invalid_argument for zero columns, zero visible rows or a
//! negative padding.
void Validate(const GridLayoutConfig& config);

struct GridCell
{
    std::size_t row = 0;
    std::size_t column = 0;

    bool operator==(const GridCell&) const = default;
};

struct TilePlacement
{
    std::size_t index = 0;
    GridCell cell;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    bool operator==(const TilePlacement&) const = default;
};

struct GridLayoutResult
{
    float itemWidth = 0.0f;
    float itemHeight = 0.0f;
    std::size_t rowCount = 0;
    float contentHeight = 0.0f;
    std::vector<TilePlacement> tiles;

    bool operator==(const GridLayoutResult&) const = default;
};

//! Places tiles into a fixed-column grid. Row height is a fixed fraction of
//! the viewport, so the scrollable content grows with the item count.
class GridLayout
{
  public:
    GridLayout() = default;
    explicit GridLayout(GridLayoutConfig config);

    [[nodiscard]] const GridLayoutConfig& Config() const noexcept { return config_; }

    [[nodiscard]] GridCell CellFor(std::size_t index) const noexcept;
    [[nodiscard]] std::size_t RowCount(std::size_t itemCount) const noexcept;
    [[nodiscard]] float ItemWidth(float viewportWidth) const noexcept;
    [[nodiscard]] float ItemHeight(float viewportHeight) const noexcept;
    [[nodiscard]] float ContentHeight(std::size_t itemCount, float viewportHeight) const noexcept;

    [[nodiscard]] GridLayoutResult Compute(std::size_t itemCount, float viewportWidth, float viewportHeight) const;

  private:
    GridLayoutConfig config_{};
};

} // namespace hearth::layout
