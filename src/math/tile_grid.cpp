/**
 * @file tile_grid.cpp
 * @brief Tile grid mathematics implementation
 */

#include <slippy_map/math/tile_grid.h>
#include <slippy_map/constants.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <unordered_set>

namespace slippy_map {

namespace {
    void ReplaceFirst(std::string& url, const std::string& placeholder, const std::string& value) {
        const std::size_t pos = url.find(placeholder);
        if (pos != std::string::npos) {
            url.replace(pos, placeholder.length(), value);
        }
    }

    // Indices beyond +/-2^62 are clamped so the conversion stays defined
    std::int64_t ToTileIndex(double value) {
        constexpr double LIMIT = 4611686018427387904.0;
        return static_cast<std::int64_t>(std::clamp(value, -LIMIT, LIMIT));
    }
}

bool TileGrid::IsSupportedZoom(std::int32_t zoom) {
    return zoom >= constants::tiles::MIN_SUPPORTED_ZOOM &&
           zoom <= constants::tiles::MAX_SUPPORTED_ZOOM;
}

std::int32_t TileGrid::WrapX(std::int64_t x, std::int32_t zoom) {
    if (!IsSupportedZoom(zoom)) {
        throw std::invalid_argument("Unsupported zoom level " + std::to_string(zoom));
    }

    const std::int64_t world_width = std::int64_t{1} << zoom;
    return static_cast<std::int32_t>(((x % world_width) + world_width) % world_width);
}

TileRange TileGrid::ComputeTileRange(const Bounds& pixel_bounds, double tile_size) {
    if (!(tile_size > 0.0)) {
        throw std::invalid_argument("Tile size must be positive");
    }

    TileRange range;
    if (!pixel_bounds.IsValid()) {
        return range;
    }

    const Point nw = pixel_bounds.min.DivideBy(tile_size).Floor();
    const Point se = pixel_bounds.max.DivideBy(tile_size).Ceil();

    range.min_x = ToTileIndex(nw.x);
    range.min_y = ToTileIndex(nw.y);
    range.max_x = ToTileIndex(se.x);
    range.max_y = ToTileIndex(se.y);
    return range;
}

std::vector<TileDescriptor> TileGrid::EnumerateTiles(const TileRange& range, std::int32_t zoom) {
    if (!IsSupportedZoom(zoom)) {
        throw std::invalid_argument("Unsupported zoom level " + std::to_string(zoom));
    }

    std::vector<TileDescriptor> tiles;
    if (range.IsEmpty()) {
        return tiles;
    }

    const std::int64_t min_y = std::max<std::int64_t>(range.min_y, std::numeric_limits<std::int32_t>::min());
    const std::int64_t max_y = std::min<std::int64_t>(range.max_y, std::numeric_limits<std::int32_t>::max());
    if (min_y > max_y) {
        return tiles;
    }

    // Columns past one world width only repeat wrapped keys
    const std::int64_t world_width = std::int64_t{1} << zoom;
    const std::int64_t columns = std::min(range.GetColumnCount(), world_width);
    tiles.reserve(static_cast<std::size_t>(columns * (max_y - min_y + 1)));

    std::unordered_set<TileDescriptor, TileDescriptorHash> seen;
    for (std::int64_t x = range.min_x; x < range.min_x + columns; ++x) {
        const std::int32_t wrapped_x = WrapX(x, zoom);
        for (std::int64_t y = min_y; y <= max_y; ++y) {
            const TileDescriptor tile(wrapped_x, static_cast<std::int32_t>(y), zoom);
            if (seen.insert(tile).second) {
                tiles.push_back(tile);
            }
        }
    }

    return tiles;
}

TileDiff TileGrid::Diff(const std::vector<TileDescriptor>& resident,
                        const std::vector<TileDescriptor>& required) {
    const std::unordered_set<TileDescriptor, TileDescriptorHash> resident_set(
        resident.begin(), resident.end());
    const std::unordered_set<TileDescriptor, TileDescriptorHash> required_set(
        required.begin(), required.end());

    TileDiff diff;
    for (const auto& tile : resident) {
        if (required_set.find(tile) == required_set.end()) {
            diff.to_remove.push_back(tile);
        }
    }
    std::sort(diff.to_remove.begin(), diff.to_remove.end());

    for (const auto& tile : required) {
        if (resident_set.find(tile) == resident_set.end()) {
            diff.to_add.push_back(tile);
        }
    }

    return diff;
}

std::string TileGrid::GetTileURL(const TileDescriptor& tile,
                                 const std::string& url_template,
                                 const std::string& subdomains) {
    std::string url = url_template;

    ReplaceFirst(url, "{x}", std::to_string(tile.x));
    ReplaceFirst(url, "{y}", std::to_string(tile.y));
    ReplaceFirst(url, "{z}", std::to_string(tile.z));

    if (!subdomains.empty()) {
        ReplaceFirst(url, "{s}", std::string(1, GetTileSubdomain(tile, subdomains)));
    }

    return url;
}

char TileGrid::GetTileSubdomain(const TileDescriptor& tile, const std::string& subdomains) {
    if (subdomains.empty()) return '\0';

    const std::int64_t count = static_cast<std::int64_t>(subdomains.length());
    const std::int64_t sum = static_cast<std::int64_t>(tile.x) + tile.y;
    const std::int64_t index = ((sum % count) + count) % count;
    return subdomains[static_cast<std::size_t>(index)];
}

} // namespace slippy_map
