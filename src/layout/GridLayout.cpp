#include "hearth/layout/GridLayout.hpp"

#include <algorithm>
#include <stdexcept>

namespace hearth::layout
{

void Validate(const GridLayoutConfig& config)
{
    if (config.columns == 0)
    {
        throw std::invalid_argument("Grid layout requires at least one column.");
    }
    if (config.visibleRows == 0)
    {
        throw std::invalid_argument("Grid layout requires at least one visible row.");
    }
    if (config.contentPadding < 0.0f)
    {
        throw std::invalid_argument("Grid layout content padding must not be negative.");
    }
}

GridLayout::GridLayout(GridLayoutConfig config)
    : config_{config}
{
    Validate(config_);
}

GridCell GridLayout::CellFor(std::size_t index) const noexcept
{
    return GridCell{index / config_.columns, index % config_.columns};
}

std::size_t GridLayout::RowCount(std::size_t itemCount) const noexcept
{
    // Round up so a partially filled last row is not clipped.
    return (itemCount + config_.columns - 1) / config_.columns;
}

float GridLayout::ItemWidth(float viewportWidth) const noexcept
{
    return std::max(viewportWidth, 0.0f) / static_cast<float>(config_.columns);
}

float GridLayout::ItemHeight(float viewportHeight) const noexcept
{
    return std::max(viewportHeight, 0.0f) / static_cast<float>(config_.visibleRows);
}

float GridLayout::ContentHeight(std::size_t itemCount, float viewportHeight) const noexcept
{
    return static_cast<float>(RowCount(itemCount)) * ItemHeight(viewportHeight) + config_.contentPadding;
}

GridLayoutResult GridLayout::Compute(std::size_t itemCount, float viewportWidth, float viewportHeight) const
{
    GridLayoutResult result;
    result.itemWidth = ItemWidth(viewportWidth);
    result.itemHeight = ItemHeight(viewportHeight);
    result.rowCount = RowCount(itemCount);
    result.contentHeight = ContentHeight(itemCount, viewportHeight);

    result.tiles.reserve(itemCount);
    for (std::size_t index = 0; index < itemCount; ++index)
    {
        TilePlacement tile;
        tile.index = index;
        tile.cell = CellFor(index);
        tile.x = static_cast<float>(tile.cell.column) * result.itemWidth;
        tile.y = static_cast<float>(tile.cell.row) * result.itemHeight;
        tile.width = result.itemWidth;
        tile.height = result.itemHeight;
        result.tiles.push_back(tile);
    }

    return result;
}

} // namespace hearth::layout
