#pragma once

/**
 * @file slippy_map.h
 * @brief Main public interface for the slippy_map library
 *
 * This header provides the library configuration and pulls in the
 * components a host needs to run a map: the view, the tile layer and the
 * host-side contracts.
 *
 * @version 0.1.0
 */

#include <slippy_map/coordinates/lat_lng.h>
#include <slippy_map/core/map_view.h>
#include <slippy_map/data/geojson.h>
#include <slippy_map/layers/marker.h>
#include <slippy_map/layers/tile_layer.h>
#include <slippy_map/platform/frame_scheduler.h>
#include <slippy_map/platform/library_info.h>
#include <slippy_map/platform/viewport_host.h>
#include <cstdint>
#include <string>

namespace slippy_map {

/**
 * @brief Configuration structure for map initialization
 *
 * The viewport size is not configured here: the map always reads it from
 * its ViewportHost.
 */
struct Configuration {
    /** Initial center latitude in degrees */
    double initial_latitude = 0.0;

    /** Initial center longitude in degrees */
    double initial_longitude = 0.0;

    /** Initial (possibly fractional) zoom level */
    double initial_zoom = 1.0;

    /** Tile URL template with {x}, {y}, {z} and optional {s} placeholders */
    std::string tile_url_template = "https://{s}.tile.openstreetmap.org/{z}/{x}/{y}.png";

    /** Subdomains substituted for {s}, one character each */
    std::string tile_subdomains = "abc";

    /** Tile edge length in pixels */
    double tile_size = 256.0;

    /** Lowest zoom level tiles are requested for */
    std::int32_t min_zoom = 0;

    /** Highest zoom level tiles are requested for */
    std::int32_t max_zoom = 18;

    /** Default duration of an animated pan in seconds */
    double pan_duration = 0.25;

    /** spdlog level name: trace, debug, info, warn, error, critical, off */
    std::string log_level = "info";

    /**
     * @brief Check the configuration for unusable values
     *
     * @throws std::invalid_argument describing the first problem found
     */
    void Validate() const;

    /**
     * @brief Initial center as a LatLng
     *
     * @throws InvalidCoordinate if the initial coordinates are not finite
     */
    LatLng GetInitialCenter() const;
};

/**
 * @brief Apply the configured log level to the default spdlog logger
 *
 * @param config Configuration carrying log_level
 * @throws std::invalid_argument if the level name is unknown
 */
void ConfigureLogging(const Configuration& config);

} // namespace slippy_map
