/**
 * @file lat_lng.cpp
 * @brief Geographic coordinate implementation
 */

#include <slippy_map/coordinates/lat_lng.h>
#include <cmath>
#include <sstream>

namespace slippy_map {

LatLng::LatLng(double lat, double lng) : lat_(lat), lng_(lng) {
    if (!std::isfinite(lat) || !std::isfinite(lng)) {
        std::ostringstream oss;
        oss << "Invalid LatLng (" << lat << ", " << lng << ")";
        throw InvalidCoordinate(oss.str());
    }
}

bool LatLng::Equals(const LatLng& other, double epsilon) const noexcept {
    return std::abs(lat_ - other.lat_) < epsilon &&
           std::abs(lng_ - other.lng_) < epsilon;
}

std::string LatLng::ToString() const {
    std::ostringstream oss;
    oss.precision(10);
    oss << "LatLng(" << lat_ << ", " << lng_ << ")";
    return oss.str();
}

} // namespace slippy_map
