/**
 * @file bounds.cpp
 * @brief Bounding rectangle implementation
 */

#include <slippy_map/math/bounds.h>
#include <algorithm>

namespace slippy_map {

Bounds& Bounds::Extend(const Point& point) {
    if (!IsValid()) {
        // First point - initialize bounds
        min = point;
        max = point;
        return *this;
    }

    min = Point(std::min(min.x, point.x), std::min(min.y, point.y));
    max = Point(std::max(max.x, point.x), std::max(max.y, point.y));
    return *this;
}

bool Bounds::Contains(const Point& point) const {
    return point.x >= min.x && point.x <= max.x &&
           point.y >= min.y && point.y <= max.y;
}

bool Bounds::Intersects(const Bounds& other) const {
    if (!IsValid() || !other.IsValid()) {
        return false;
    }

    return min.x <= other.max.x && max.x >= other.min.x &&
           min.y <= other.max.y && max.y >= other.min.y;
}

} // namespace slippy_map
