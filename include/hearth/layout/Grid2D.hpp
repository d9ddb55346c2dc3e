#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hearth::layout
{

//! A cell coordinate. X grows to the right, Y grows downwards.
struct Point
{
    int x = 0;
    int y = 0;

    [[nodiscard]] Point Offset(const Point& delta) const noexcept { return Point{x + delta.x, y + delta.y}; }
    [[nodiscard]] Point Scaled(int factor) const noexcept { return Point{x * factor, y * factor}; }

    bool operator==(const Point&) const = default;
};

//! Inclusive cell rectangle.
class Rect
{
  public:
    Rect() = default;
    Rect(std::size_t xStart, std::size_t xEnd, std::size_t yStart, std::size_t yEnd)
        : xStart_{xStart}
        , xEnd_{xEnd}
        , yStart_{yStart}
        , yEnd_{yEnd}
    {
        if (xEnd < xStart || yEnd < yStart)
        {
            throw std::invalid_argument("Rect end must be greater than or equal to its start.");
        }
    }

    [[nodiscard]] std::size_t XStart() const noexcept { return xStart_; }
    [[nodiscard]] std::size_t XEnd() const noexcept { return xEnd_; }
    [[nodiscard]] std::size_t YStart() const noexcept { return yStart_; }
    [[nodiscard]] std::size_t YEnd() const noexcept { return yEnd_; }
    [[nodiscard]] std::size_t Width() const noexcept { return xEnd_ - xStart_ + 1; }
    [[nodiscard]] std::size_t Height() const noexcept { return yEnd_ - yStart_ + 1; }

    [[nodiscard]] Point TopLeft() const noexcept { return Point{static_cast<int>(xStart_), static_cast<int>(yStart_)}; }
    [[nodiscard]] Point TopRight() const noexcept { return Point{static_cast<int>(xEnd_), static_cast<int>(yStart_)}; }
    [[nodiscard]] Point BottomLeft() const noexcept { return Point{static_cast<int>(xStart_), static_cast<int>(yEnd_)}; }
    [[nodiscard]] Point BottomRight() const noexcept { return Point{static_cast<int>(xEnd_), static_cast<int>(yEnd_)}; }

    [[nodiscard]] bool Contains(const Point& point) const noexcept
    {
        return point.x >= static_cast<int>(xStart_) && point.x <= static_cast<int>(xEnd_)
            && point.y >= static_cast<int>(yStart_) && point.y <= static_cast<int>(yEnd_);
    }

    bool operator==(const Rect&) const = default;

  private:
    std::size_t xStart_ = 0;
    std::size_t xEnd_ = 0;
    std::size_t yStart_ = 0;
    std::size_t yEnd_ = 0;
};

//! Column-major cell storage that can only grow.
template <typename T>
class Grid2D
{
  public:
    Grid2D(std::size_t width, std::size_t height)
    {
        Reset(width, height);
    }

    [[nodiscard]] std::size_t Width() const noexcept { return width_; }
    [[nodiscard]] std::size_t Height() const noexcept { return height_; }

    //! Drops every cell and resizes to width x height.
    void Reset(std::size_t width, std::size_t height)
    {
        if (width == 0 || height == 0)
        {
            throw std::invalid_argument("Grid dimensions must be greater than zero.");
        }

        width_ = width;
        height_ = height;
        cells_.assign(width_, std::vector<std::optional<T>>(height_));
    }

    void Expand(std::size_t newWidth, std::size_t newHeight)
    {
        if (newWidth < width_)
        {
            throw std::invalid_argument(
                "New width is smaller than the current width, which is " + std::to_string(width_) + ".");
        }
        if (newHeight < height_)
        {
            throw std::invalid_argument(
                "New height is smaller than the current height, which is " + std::to_string(height_) + ".");
        }

        for (auto& column : cells_)
        {
            column.resize(newHeight);
        }
        cells_.resize(newWidth, std::vector<std::optional<T>>(newHeight));

        width_ = newWidth;
        height_ = newHeight;
    }

    [[nodiscard]] bool Contains(int x, int y) const noexcept
    {
        return x >= 0 && y >= 0 && x < static_cast<int>(width_) && y < static_cast<int>(height_);
    }

    [[nodiscard]] bool Contains(const Point& point) const noexcept { return Contains(point.x, point.y); }

    [[nodiscard]] bool Contains(const Rect& rect) const noexcept
    {
        return rect.XEnd() < width_ && rect.YEnd() < height_;
    }

    //! Claims every cell of the rectangle. The area must be in bounds and empty.
    void Fill(const Rect& rect, const T& value)
    {
        if (!Contains(rect))
        {
            throw std::out_of_range("Rect exceeds the grid bounds.");
        }

        for (std::size_t x = rect.XStart(); x <= rect.XEnd(); ++x)
        {
            for (std::size_t y = rect.YStart(); y <= rect.YEnd(); ++y)
            {
                if (cells_[x][y].has_value())
                {
                    throw std::invalid_argument(
                        "Overlapping rect at " + std::to_string(x) + ", " + std::to_string(y) + ".");
                }
            }
        }

        for (std::size_t x = rect.XStart(); x <= rect.XEnd(); ++x)
        {
            for (std::size_t y = rect.YStart(); y <= rect.YEnd(); ++y)
            {
                cells_[x][y] = value;
            }
        }
    }

    [[nodiscard]] const std::optional<T>& At(std::size_t x, std::size_t y) const
    {
        if (x >= width_ || y >= height_)
        {
            throw std::out_of_range("Invalid coordinate " + std::to_string(x) + ", " + std::to_string(y) + ".");
        }
        return cells_[x][y];
    }

    [[nodiscard]] const std::optional<T>& At(const Point& point) const
    {
        if (point.x < 0 || point.y < 0)
        {
            throw std::out_of_range("Invalid coordinate " + std::to_string(point.x) + ", " + std::to_string(point.y) + ".");
        }
        return At(static_cast<std::size_t>(point.x), static_cast<std::size_t>(point.y));
    }

  private:
    std::size_t width_ = 0;
    std::size_t height_ = 0;
    std::vector<std::vector<std::optional<T>>> cells_;
};

} // namespace hearth::layout
