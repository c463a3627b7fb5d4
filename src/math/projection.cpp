/**
 * @file projection.cpp
 * @brief Web Mercator projection implementation
 */

#include <slippy_map/math/projection.h>
#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>

namespace slippy_map {

// Helper functions
namespace {
    constexpr double PI = constants::projection::PI;

    inline double DegreesToRadians(double degrees) {
        return glm::radians(degrees);
    }

    inline double RadiansToDegrees(double radians) {
        return glm::degrees(radians);
    }

    inline double PixelsPerMeter(double zoom) {
        return WebMercatorProjection::Scale(zoom) / WebMercatorProjection::EARTH_RADIUS;
    }
}

double WebMercatorProjection::ClampLatitude(double latitude) {
    return std::max(-MAX_LATITUDE, std::min(MAX_LATITUDE, latitude));
}

Point WebMercatorProjection::Project(const LatLng& latlng) {
    const double lat_rad = DegreesToRadians(ClampLatitude(latlng.GetLat()));
    const double lon_rad = DegreesToRadians(latlng.GetLng());
    const double sin_lat = std::sin(lat_rad);

    return Point(
        EARTH_RADIUS * lon_rad,
        EARTH_RADIUS * std::log((1.0 + sin_lat) / (1.0 - sin_lat)) / 2.0
    );
}

LatLng WebMercatorProjection::Unproject(const Point& point) {
    const double lat_rad = 2.0 * std::atan(std::exp(point.y / EARTH_RADIUS)) - PI / 2.0;
    const double lon_rad = point.x / EARTH_RADIUS;

    return LatLng(RadiansToDegrees(lat_rad), RadiansToDegrees(lon_rad));
}

double WebMercatorProjection::Scale(double zoom) {
    return constants::projection::BASE_SCALE * std::pow(2.0, zoom);
}

double WebMercatorProjection::ZoomForScale(double scale) {
    return std::log2(scale / constants::projection::BASE_SCALE);
}

Point WebMercatorProjection::ProjectToPixels(const LatLng& latlng, double zoom) {
    return Project(latlng).MultiplyBy(PixelsPerMeter(zoom));
}

LatLng WebMercatorProjection::UnprojectFromPixels(const Point& point, double zoom) {
    return Unproject(point.DivideBy(PixelsPerMeter(zoom)));
}

} // namespace slippy_map
