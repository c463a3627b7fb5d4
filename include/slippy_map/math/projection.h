#pragma once

/**
 * @file projection.h
 * @brief Spherical Web Mercator projection and zoom/scale conversion
 *
 * Stateless geographic <-> planar mapping. Projected space is in meters on
 * a sphere of radius EARTH_RADIUS; pixel space is projected space scaled so
 * that the world is Scale(zoom) pixels wide.
 */

#include <slippy_map/coordinates/lat_lng.h>
#include <slippy_map/math/point.h>
#include <slippy_map/constants.h>

namespace slippy_map {

/**
 * @brief Spherical Web Mercator (EPSG:3857)
 *
 * All members are static; there is no per-instance state. The latitude
 * clamp to +/-MAX_LATITUDE is applied on every projection, including the
 * pixel-space helpers, so repeated projection near the poles cannot drift.
 */
class WebMercatorProjection {
public:
    static constexpr double EARTH_RADIUS = constants::projection::EARTH_RADIUS;
    static constexpr double MAX_LATITUDE = constants::projection::MAX_LATITUDE;

    /**
     * @brief Project geographic coordinates to Mercator meters
     *
     * Latitude is clamped to +/-MAX_LATITUDE first; out-of-range input is
     * never an error.
     *
     * @param latlng Geographic coordinates
     * @return Point Projected coordinates in meters (y grows northward)
     */
    static Point Project(const LatLng& latlng);

    /**
     * @brief Inverse of Project
     *
     * @param point Projected coordinates in meters
     * @return LatLng Geographic coordinates
     * @throws InvalidCoordinate if the point is not finite
     */
    static LatLng Unproject(const Point& point);

    /**
     * @brief Pixel width of the world at a zoom level: 256 * 2^zoom
     *
     * @param zoom Zoom level (may be fractional)
     */
    static double Scale(double zoom);

    /**
     * @brief Inverse of Scale: log2(scale / 256)
     *
     * @param scale Pixel width of the world
     */
    static double ZoomForScale(double scale);

    /**
     * @brief Project to pixel space at a zoom level
     *
     * @param latlng Geographic coordinates
     * @param zoom Zoom level (may be fractional)
     * @return Point Pixel coordinates
     */
    static Point ProjectToPixels(const LatLng& latlng, double zoom);

    /**
     * @brief Inverse of ProjectToPixels
     *
     * @param point Pixel coordinates
     * @param zoom Zoom level the pixels were computed at
     * @return LatLng Geographic coordinates
     */
    static LatLng UnprojectFromPixels(const Point& point, double zoom);

    /**
     * @brief Clamp a latitude into the projectable range
     */
    static double ClampLatitude(double latitude);
};

} // namespace slippy_map
