#pragma once

/**
 * @file tile_grid.h
 * @brief Tile coordinate system and visible tile set computation
 *
 * Pure tiling algorithm: from pixel bounds to the set of tile descriptors
 * covering them, x wraparound across the antimeridian, and the diff between
 * the resident tile set and the required one.
 */

#include <slippy_map/math/bounds.h>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace slippy_map {

/**
 * @brief Tile coordinates (X, Y, Zoom)
 *
 * x is normalized into [0, 2^z) by the grid; y and z are never wrapped.
 */
struct TileDescriptor {
    std::int32_t x;  ///< Tile column
    std::int32_t y;  ///< Tile row
    std::int32_t z;  ///< Zoom level

    constexpr TileDescriptor() : x(0), y(0), z(0) {}
    constexpr TileDescriptor(std::int32_t tile_x, std::int32_t tile_y, std::int32_t tile_z)
        : x(tile_x), y(tile_y), z(tile_z) {}

    /**
     * @brief Get tile key as string
     *
     * @return std::string Key in format "x:y:z"
     */
    std::string GetKey() const {
        return std::to_string(x) + ":" + std::to_string(y) + ":" + std::to_string(z);
    }

    bool operator==(const TileDescriptor& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    bool operator!=(const TileDescriptor& other) const {
        return !(*this == other);
    }

    /**
     * @brief Less than operator (for sorting)
     */
    bool operator<(const TileDescriptor& other) const {
        if (z != other.z) return z < other.z;
        if (x != other.x) return x < other.x;
        return y < other.y;
    }
};

/**
 * @brief Hash function for TileDescriptor
 */
struct TileDescriptorHash {
    std::size_t operator()(const TileDescriptor& coords) const {
        std::hash<std::uint64_t> hasher;
        const std::uint64_t combined =
            (static_cast<std::uint64_t>(static_cast<std::uint32_t>(coords.z)) << 58) ^
            (static_cast<std::uint64_t>(static_cast<std::uint32_t>(coords.x)) << 29) ^
            static_cast<std::uint64_t>(static_cast<std::uint32_t>(coords.y));
        return hasher(combined);
    }
};

/**
 * @brief Closed integer rectangle of (unwrapped) tile indices
 *
 * Indices are 64-bit: unwrapped columns at high zoom or far longitudes do
 * not fit in a tile descriptor until they are wrapped.
 */
struct TileRange {
    std::int64_t min_x = 0;
    std::int64_t min_y = 0;
    std::int64_t max_x = -1;
    std::int64_t max_y = -1;

    bool IsEmpty() const { return min_x > max_x || min_y > max_y; }

    std::int64_t GetColumnCount() const {
        return IsEmpty() ? 0 : max_x - min_x + 1;
    }

    std::int64_t GetRowCount() const {
        return IsEmpty() ? 0 : max_y - min_y + 1;
    }
};

/**
 * @brief Add/remove instructions produced by reconciling two tile sets
 */
struct TileDiff {
    std::vector<TileDescriptor> to_add;     ///< Required but not resident, in enumeration order
    std::vector<TileDescriptor> to_remove;  ///< Resident but no longer required, sorted

    bool IsEmpty() const { return to_add.empty() && to_remove.empty(); }
};

/**
 * @brief Tile grid mathematics
 */
class TileGrid {
public:
    /**
     * @brief Normalize a tile column into [0, 2^zoom)
     *
     * Handles negative columns: ((x mod 2^z) + 2^z) mod 2^z.
     *
     * @param x Unwrapped tile column
     * @param zoom Zoom level in [0, MAX_SUPPORTED_ZOOM]
     * @return std::int32_t Wrapped column
     * @throws std::invalid_argument if zoom is unsupported
     */
    static std::int32_t WrapX(std::int64_t x, std::int32_t zoom);

    /**
     * @brief Tile index rectangle covering pixel bounds
     *
     * nw = floor(min / tile_size), se = ceil(max / tile_size). Both ends are
     * inclusive, so bounds falling exactly on a tile edge over-fetch by one
     * row/column rather than under-fetch.
     *
     * @param pixel_bounds Viewport bounds in pixel space
     * @param tile_size Tile edge length in pixels
     * @return TileRange Unwrapped tile index range (empty for undefined bounds)
     * @throws std::invalid_argument if tile_size is not positive
     */
    static TileRange ComputeTileRange(const Bounds& pixel_bounds, double tile_size);

    /**
     * @brief Enumerate every tile of a range at a zoom level
     *
     * Columns are wrapped, rows are not. Tiles that wrap onto the same key
     * are listed once. Rows outside the int32 range of a tile descriptor
     * are skipped.
     *
     * @param range Unwrapped tile range
     * @param zoom Tile grid zoom level
     * @return std::vector<TileDescriptor> Tiles in column-major order
     * @throws std::invalid_argument if zoom is unsupported
     */
    static std::vector<TileDescriptor> EnumerateTiles(const TileRange& range, std::int32_t zoom);

    /**
     * @brief Diff the resident tile set against the required set
     *
     * @param resident Tiles currently shown
     * @param required Tiles that must be shown
     * @return TileDiff Tiles to instantiate and tiles to retire
     */
    static TileDiff Diff(const std::vector<TileDescriptor>& resident,
                         const std::vector<TileDescriptor>& required);

    /**
     * @brief Get tile URL for standard tile servers
     *
     * Substitutes the first occurrence of {x}, {y} and {z} with decimal tile
     * coordinates and, when subdomains are given, {s} with one of them.
     * Anything else in the template passes through unchanged.
     *
     * @param tile Tile coordinates
     * @param url_template URL template with {x}, {y}, {z} placeholders
     * @param subdomains Available subdomains (e.g. "abc"), may be empty
     * @return std::string Tile URL
     */
    static std::string GetTileURL(const TileDescriptor& tile,
                                  const std::string& url_template,
                                  const std::string& subdomains = "");

    /**
     * @brief Get subdomain for tile servers (load balancing)
     *
     * @param tile Tile coordinates
     * @param subdomains Available subdomains (e.g., "abc")
     * @return char Selected subdomain, '\0' if none are available
     */
    static char GetTileSubdomain(const TileDescriptor& tile, const std::string& subdomains);

    /**
     * @brief Check if zoom level is supported by the grid
     */
    static bool IsSupportedZoom(std::int32_t zoom);
};

} // namespace slippy_map
