/**
 * @file library_info.cpp
 * @brief Library version and dependency information
 */

#include <slippy_map/platform/library_info.h>
#include <glm/glm.hpp>
#include <spdlog/version.h>
#include <sstream>

#ifndef SLIPPY_MAP_VERSION
#define SLIPPY_MAP_VERSION "0.1.0"
#endif

namespace slippy_map {

std::string LibraryInfo::GetVersion() {
    return SLIPPY_MAP_VERSION;
}

std::string LibraryInfo::GetBuildInfo() {
    std::ostringstream oss;
    oss << "Slippy Map " << GetVersion() << " - Built on " << __DATE__ << " " << __TIME__;
#ifdef NDEBUG
    oss << " (release)";
#else
    oss << " (debug)";
#endif
    return oss.str();
}

std::string LibraryInfo::GetDependencyInfo() {
    std::ostringstream oss;
    oss << "spdlog " << SPDLOG_VER_MAJOR << "." << SPDLOG_VER_MINOR << "." << SPDLOG_VER_PATCH
        << ", glm " << GLM_VERSION_MAJOR << "." << GLM_VERSION_MINOR << "." << GLM_VERSION_PATCH;
    return oss.str();
}

} // namespace slippy_map
