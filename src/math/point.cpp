/**
 * @file point.cpp
 * @brief Planar coordinate implementation
 */

#include <slippy_map/math/point.h>
#include <sstream>

namespace slippy_map {

std::string Point::ToString() const {
    std::ostringstream oss;
    oss << "Point(" << x << ", " << y << ")";
    return oss.str();
}

} // namespace slippy_map
