/**
 * @file slippy_map.cpp
 * @brief Configuration validation and logging setup
 */

#include <slippy_map/slippy_map.h>
#include <slippy_map/math/tile_grid.h>
#include <slippy_map/constants.h>
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>
#include <string>

namespace slippy_map {

void Configuration::Validate() const {
    if (!std::isfinite(initial_latitude) || !std::isfinite(initial_longitude)) {
        throw std::invalid_argument("Initial center must be finite");
    }
    if (!std::isfinite(initial_zoom)) {
        throw std::invalid_argument("Initial zoom must be finite");
    }
    if (!(tile_size > 0.0) || !std::isfinite(tile_size)) {
        throw std::invalid_argument("Tile size must be positive");
    }
    if (!TileGrid::IsSupportedZoom(min_zoom) || !TileGrid::IsSupportedZoom(max_zoom)) {
        throw std::invalid_argument("Zoom range must lie within [" +
                                    std::to_string(constants::tiles::MIN_SUPPORTED_ZOOM) + ", " +
                                    std::to_string(constants::tiles::MAX_SUPPORTED_ZOOM) + "]");
    }
    if (min_zoom > max_zoom) {
        throw std::invalid_argument("min_zoom must not exceed max_zoom");
    }
    if (!(pan_duration >= 0.0)) {
        throw std::invalid_argument("Pan duration must be non-negative");
    }
    if (tile_url_template.empty()) {
        throw std::invalid_argument("Tile URL template must not be empty");
    }
}

LatLng Configuration::GetInitialCenter() const {
    return LatLng(initial_latitude, initial_longitude);
}

void ConfigureLogging(const Configuration& config) {
    const spdlog::level::level_enum level = spdlog::level::from_str(config.log_level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && config.log_level != "off") {
        throw std::invalid_argument("Unknown log level: " + config.log_level);
    }
    spdlog::set_level(level);
}

} // namespace slippy_map
