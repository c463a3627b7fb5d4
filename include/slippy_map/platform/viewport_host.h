#pragma once

/**
 * @file viewport_host.h
 * @brief Host-side viewport contract
 *
 * The map never measures a window itself. It asks the host element for
 * its size, both at construction and on InvalidateSize().
 */

#include <slippy_map/math/point.h>

namespace slippy_map {

/**
 * @brief Element the map is displayed in
 */
class ViewportHost {
public:
    virtual ~ViewportHost() = default;

    /**
     * @brief Get the viewport size in pixels
     *
     * @return Point (width, height)
     */
    virtual Point GetSize() const = 0;
};

/**
 * @brief Viewport host with an explicitly set size
 *
 * Used by headless hosts, examples and tests.
 */
class FixedViewportHost : public ViewportHost {
public:
    explicit FixedViewportHost(const Point& size);

    Point GetSize() const override { return size_; }

    /**
     * @brief Change the reported size
     *
     * The map picks the new size up on its next InvalidateSize().
     *
     * @throws std::invalid_argument if a dimension is negative or not finite
     */
    void SetSize(const Point& size);

private:
    Point size_;
};

} // namespace slippy_map
