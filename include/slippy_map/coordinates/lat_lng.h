/**
 * @file lat_lng.h
 * @brief Geographic coordinate value type
 *
 * LatLng is the coordinate type of every user-facing API. It is validated
 * once at construction; afterwards it is a plain immutable value.
 */

#pragma once

#include <slippy_map/constants.h>
#include <stdexcept>
#include <string>

namespace slippy_map {

/**
 * @brief Thrown when a LatLng is built from a non-finite component
 *
 * This signals a caller bug; the library never catches it.
 */
class InvalidCoordinate : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Geographic coordinates in degrees
 *
 * Latitude and longitude are not range-checked: projection clamps latitude
 * and tiling wraps longitude. Only NaN and infinities are rejected.
 */
class LatLng {
public:
    /**
     * @brief Construct from latitude / longitude
     *
     * @param lat Latitude in degrees
     * @param lng Longitude in degrees
     * @throws InvalidCoordinate if either component is not finite
     */
    LatLng(double lat, double lng);

    [[nodiscard]] double GetLat() const noexcept { return lat_; }
    [[nodiscard]] double GetLng() const noexcept { return lng_; }

    /**
     * @brief Approximate equality
     *
     * @param other Coordinates to compare
     * @param epsilon Tolerance in degrees (default: 1e-9)
     */
    [[nodiscard]] bool Equals(const LatLng& other,
                              double epsilon = constants::geometry::LATLNG_EPSILON) const noexcept;

    [[nodiscard]] std::string ToString() const;

    bool operator==(const LatLng& other) const noexcept { return Equals(other); }
    bool operator!=(const LatLng& other) const noexcept { return !Equals(other); }

private:
    double lat_;
    double lng_;
};

} // namespace slippy_map
