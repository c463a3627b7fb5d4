#pragma once

/**
 * @file bounds.h
 * @brief Axis-aligned rectangle over planar points
 */

#include <slippy_map/math/point.h>
#include <limits>

namespace slippy_map {

/**
 * @brief Axis-aligned bounding rectangle in pixel (or projected) space
 *
 * A default-constructed Bounds is undefined: min and max are inverted so
 * that IsValid() is false and Contains() rejects every point until the
 * first Extend().
 */
struct Bounds {
    Point min;  ///< Top-left corner (smallest x and y)
    Point max;  ///< Bottom-right corner (largest x and y)

    /**
     * @brief Default constructor - creates undefined bounds
     */
    constexpr Bounds()
        : min(std::numeric_limits<double>::max(), std::numeric_limits<double>::max())
        , max(std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()) {
    }

    /**
     * @brief Construct the smallest bounds enclosing two points
     *
     * @param a First corner
     * @param b Opposite corner (any order)
     */
    Bounds(const Point& a, const Point& b) : Bounds() {
        Extend(a);
        Extend(b);
    }

    /**
     * @brief Grow the bounds to include a point
     *
     * @param point Point to merge in
     * @return Bounds& This bounds, for chaining
     */
    Bounds& Extend(const Point& point);

    /**
     * @brief Check if a point lies inside the bounds (edges inclusive)
     */
    bool Contains(const Point& point) const;

    /**
     * @brief Check whether another bounds overlaps this one (touching counts)
     */
    bool Intersects(const Bounds& other) const;

    /**
     * @brief Get the extent as a point (max - min)
     */
    Point GetSize() const {
        return max.Subtract(min);
    }

    /**
     * @brief Get the center point
     */
    Point GetCenter() const {
        return min.Add(max).DivideBy(2.0);
    }

    /**
     * @brief Check whether at least one point has been merged in
     */
    constexpr bool IsValid() const {
        return min.x <= max.x && min.y <= max.y;
    }
};

} // namespace slippy_map
