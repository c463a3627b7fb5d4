/**
 * @file viewport_host.cpp
 * @brief Fixed-size viewport host implementation
 */

#include <slippy_map/platform/viewport_host.h>
#include <cmath>
#include <stdexcept>

namespace slippy_map {

// FixedViewportHost implementation

FixedViewportHost::FixedViewportHost(const Point& size) {
    SetSize(size);
}

void FixedViewportHost::SetSize(const Point& size) {
    if (!std::isfinite(size.x) || !std::isfinite(size.y) || size.x < 0.0 || size.y < 0.0) {
        throw std::invalid_argument("Viewport size must be finite and non-negative");
    }
    size_ = size;
}

} // namespace slippy_map
