#pragma once

/**
 * @file library_info.h
 * @brief Library information and utilities
 *
 * Provides version information and build details.
 */

#include <string>

namespace slippy_map {

/**
 * @brief Library information and utilities
 */
class LibraryInfo {
public:
    /**
     * @brief Get library version
     *
     * @return std::string Version string in format "major.minor.patch"
     */
    static std::string GetVersion();

    /**
     * @brief Get build information
     *
     * @return std::string Build timestamp and configuration
     */
    static std::string GetBuildInfo();

    /**
     * @brief Versions of the libraries compiled in
     *
     * @return std::string e.g. "spdlog 1.12.0, glm 0.9.9"
     */
    static std::string GetDependencyInfo();
};

} // namespace slippy_map
