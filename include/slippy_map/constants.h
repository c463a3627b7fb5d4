#pragma once

/**
 * @file constants.h
 * @brief Central repository for all slippy_map constants
 *
 * Single source of truth for projection parameters, tiling defaults and
 * view behaviour. Implementation files must not carry their own copies of
 * these numbers.
 */

#include <cstdint>

namespace slippy_map {
namespace constants {

//==============================================================================
// Projection Constants (Spherical Web Mercator)
//==============================================================================

/**
 * @namespace projection
 * @brief Spherical Web Mercator parameters
 *
 * Units: meters for projected space, degrees for geographic space.
 */
namespace projection {
    /// Sphere radius used by Web Mercator (WGS84 semi-major axis) in meters
    constexpr double EARTH_RADIUS = 6378137.0;

    /// Latitude limit beyond which Web Mercator diverges, in degrees
    constexpr double MAX_LATITUDE = 85.0511287798;

    /// Pixel width of the whole world at zoom 0
    constexpr double BASE_SCALE = 256.0;

    constexpr double PI = 3.14159265358979323846;
} // namespace projection

//==============================================================================
// Geometry Constants
//==============================================================================

namespace geometry {
    /// Tolerance used by approximate LatLng equality, in degrees
    constexpr double LATLNG_EPSILON = 1e-9;
} // namespace geometry

//==============================================================================
// Tiling Constants
//==============================================================================

/**
 * @namespace tiles
 * @brief Tile grid defaults
 */
namespace tiles {
    /// Default tile edge length in pixels
    constexpr double DEFAULT_TILE_SIZE = 256.0;

    /// Lowest zoom level a tile grid can be built for
    constexpr std::int32_t MIN_SUPPORTED_ZOOM = 0;

    /// Highest zoom level a tile grid can be built for. Default-size tile rows
    /// reach +/-pi * 2^zoom and must fit in int32
    constexpr std::int32_t MAX_SUPPORTED_ZOOM = 29;

    /// Default zoom range served by a tile layer
    constexpr std::int32_t DEFAULT_MIN_ZOOM = 0;
    constexpr std::int32_t DEFAULT_MAX_ZOOM = 18;

    /// 1x1 transparent GIF shown in place of tiles that failed to load
    constexpr const char* ERROR_PLACEHOLDER_SRC =
        "data:image/gif;base64,R0lGODlhAQABAAD/ACwAAAAAAQABAAACADs=";
} // namespace tiles

//==============================================================================
// View Defaults
//==============================================================================

/**
 * @namespace view
 * @brief Map view and animation defaults
 */
namespace view {
    /// Default duration of an animated pan in seconds
    constexpr double DEFAULT_PAN_DURATION = 0.25;

    /// Target frame interval of the host's per-frame callback in seconds (~60 Hz)
    constexpr double FRAME_INTERVAL = 1.0 / 60.0;

    /// Default zoom delta of ZoomIn / ZoomOut
    constexpr double DEFAULT_ZOOM_DELTA = 1.0;
} // namespace view

//==============================================================================
// Event Names
//==============================================================================

namespace events {
    constexpr const char* MOVEEND = "moveend";
    constexpr const char* RESIZE = "resize";
    constexpr const char* END = "end";
    constexpr const char* TILE_LOAD_START = "tileloadstart";
    constexpr const char* TILE_LOAD = "tileload";
    constexpr const char* TILE_ERROR = "tileerror";
    constexpr const char* TILE_UNLOAD = "tileunload";
    constexpr const char* LOAD = "load";
} // namespace events

} // namespace constants
} // namespace slippy_map
