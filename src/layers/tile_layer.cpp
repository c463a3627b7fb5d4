/**
 * @file tile_layer.cpp
 * @brief Tile layer implementation
 */

#include <slippy_map/layers/tile_layer.h>
#include <slippy_map/core/map_view.h>
#include <slippy_map/slippy_map.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace slippy_map {

// ============================================================================
// TileLayerOptions / ContainerTransform
// ============================================================================

TileLayerOptions TileLayerOptions::FromConfiguration(const Configuration& config) {
    TileLayerOptions options;
    options.tile_size = config.tile_size;
    options.subdomains = config.tile_subdomains;
    options.min_zoom = config.min_zoom;
    options.max_zoom = config.max_zoom;
    return options;
}

glm::dmat3 ContainerTransform::ToMatrix() const {
    // Column-major: third column holds the translation
    glm::dmat3 matrix(scale);
    matrix[2][0] = offset.x;
    matrix[2][1] = offset.y;
    matrix[2][2] = 1.0;
    return matrix;
}

// ============================================================================
// DeferredTileLoader
// ============================================================================

void DeferredTileLoader::Load(const TileLoadRequest& request, Callback callback) {
    pending_.push_back({request, std::move(callback)});
}

bool DeferredTileLoader::Complete(const TileDescriptor& coords, bool success, const std::string& reason) {
    const auto it = std::find_if(pending_.begin(), pending_.end(),
                                 [&coords](const PendingLoad& load) {
                                     return load.request.coords == coords;
                                 });
    if (it == pending_.end()) {
        return false;
    }

    // Erase before invoking: the callback may issue new loads
    Callback callback = std::move(it->callback);
    pending_.erase(it);
    if (callback) {
        callback(success, success ? std::string() : reason);
    }
    return true;
}

std::size_t DeferredTileLoader::CompleteAll(bool success, const std::string& reason) {
    std::deque<PendingLoad> loads;
    loads.swap(pending_);

    for (auto& load : loads) {
        if (load.callback) {
            load.callback(success, success ? std::string() : reason);
        }
    }
    return loads.size();
}

std::vector<TileLoadRequest> DeferredTileLoader::GetPendingRequests() const {
    std::vector<TileLoadRequest> requests;
    requests.reserve(pending_.size());
    for (const auto& load : pending_) {
        requests.push_back(load.request);
    }
    return requests;
}

// ============================================================================
// TileLayer
// ============================================================================

TileLayer::TileLayer(std::string url_template,
                     std::shared_ptr<TileLoader> loader,
                     TileLayerOptions options)
    : url_template_(std::move(url_template))
    , loader_(std::move(loader))
    , options_(std::move(options)) {
    if (!loader_) {
        throw std::invalid_argument("Tile layer requires a tile loader");
    }
    if (!(options_.tile_size > 0.0) || !std::isfinite(options_.tile_size)) {
        throw std::invalid_argument("Tile size must be positive");
    }
    if (options_.min_zoom > options_.max_zoom) {
        throw std::invalid_argument("Tile layer min_zoom must not exceed max_zoom");
    }
}

TileLayer::~TileLayer() {
    if (map_) {
        map_->OffContext(this);
    }
}

void TileLayer::OnAdd(MapView& map) {
    map_ = &map;
    Reconcile();
    moveend_listener_ = map.On(constants::events::MOVEEND,
                               [this](const Event&) { Reconcile(); },
                               this);
}

void TileLayer::OnRemove() {
    if (!map_) {
        return;
    }
    map_->Off(constants::events::MOVEEND, moveend_listener_);
    moveend_listener_ = 0;

    ClearTiles();
    map_ = nullptr;
    tile_zoom_.reset();
    load_event_pending_ = false;
}

void TileLayer::Update() {
    Reconcile();
}

std::string TileLayer::GetTileUrl(const TileDescriptor& coords) const {
    return TileGrid::GetTileURL(coords, url_template_, options_.subdomains);
}

const TileElement* TileLayer::GetTile(const TileDescriptor& coords) const {
    const auto it = tiles_.find(coords);
    return it == tiles_.end() ? nullptr : &it->second;
}

std::vector<TileDescriptor> TileLayer::GetTileKeys() const {
    std::vector<TileDescriptor> keys;
    keys.reserve(tiles_.size());
    for (const auto& [coords, tile] : tiles_) {
        keys.push_back(coords);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool TileLayer::IsLoading() const {
    return std::any_of(tiles_.begin(), tiles_.end(), [](const auto& entry) {
        return entry.second.state == TileState::LOADING;
    });
}

void TileLayer::Reconcile() {
    if (!map_) {
        return;
    }

    const std::uint64_t generation = ++reconcile_generation_;
    const auto superseded = [this, generation]() {
        return !map_ || reconcile_generation_ != generation;
    };

    const std::int32_t zoom = static_cast<std::int32_t>(std::floor(map_->GetZoom() + 0.5));
    if (zoom < options_.min_zoom || zoom > options_.max_zoom || !TileGrid::IsSupportedZoom(zoom)) {
        spdlog::debug("Zoom {} outside tile layer range [{}, {}], retiring all tiles",
                      zoom, options_.min_zoom, options_.max_zoom);
        TileDiff diff{{}, GetTileKeys()};
        ++reconcile_depth_;
        ClearTiles();
        --reconcile_depth_;
        if (!superseded()) {
            last_diff_ = std::move(diff);
            tile_zoom_.reset();
            load_event_pending_ = false;
        }
        return;
    }

    const TileRange range = TileGrid::ComputeTileRange(map_->GetPixelBounds(), options_.tile_size);
    const std::vector<TileDescriptor> required = TileGrid::EnumerateTiles(range, zoom);
    TileDiff diff = TileGrid::Diff(GetTileKeys(), required);

    ++reconcile_depth_;
    for (const auto& coords : diff.to_remove) {
        if (superseded()) {
            break;
        }
        RemoveTile(coords);
    }

    if (!superseded()) {
        tile_zoom_ = zoom;
        UpdateContainerTransform(zoom);
    }

    // Loaders may complete synchronously; their listeners can move the map
    for (const auto& coords : diff.to_add) {
        if (superseded()) {
            break;
        }
        AddTile(coords);
    }
    --reconcile_depth_;

    if (superseded()) {
        spdlog::debug("Tile reconcile at zoom {} superseded by a nested view change", zoom);
        FireLoadIfSettled();
        return;
    }

    if (!diff.IsEmpty()) {
        spdlog::debug("Tile reconcile at zoom {}: +{} -{} ({} resident)",
                      zoom, diff.to_add.size(), diff.to_remove.size(), tiles_.size());
    }
    last_diff_ = std::move(diff);
    FireLoadIfSettled();
}

void TileLayer::AddTile(const TileDescriptor& coords) {
    TileElement tile;
    tile.coords = coords;
    tile.size = options_.tile_size;
    tile.position = Point(coords.x * options_.tile_size, coords.y * options_.tile_size);
    tile.url = GetTileUrl(coords);
    tile.src = tile.url;
    tile.state = TileState::LOADING;
    tile.load_id = next_load_id_++;

    const std::uint64_t load_id = tile.load_id;
    const TileLoadRequest request{coords, tile.url};
    tiles_[coords] = std::move(tile);

    Fire(constants::events::TILE_LOAD_START, {{"coords", coords}, {"url", request.url}});

    // A listener may have moved the map and retired the tile already
    const auto it = tiles_.find(coords);
    if (it == tiles_.end() || it->second.load_id != load_id) {
        return;
    }

    std::weak_ptr<Layer> weak_self = weak_from_this();
    loader_->Load(request, [this, weak_self, coords, load_id](bool success, const std::string& reason) {
        // The layer may be gone by the time the host completes the load
        if (const auto self = weak_self.lock()) {
            HandleTileLoaded(coords, load_id, success, reason);
        }
    });
}

void TileLayer::RemoveTile(const TileDescriptor& coords) {
    const auto it = tiles_.find(coords);
    if (it == tiles_.end()) {
        return;
    }
    const std::string url = it->second.url;
    tiles_.erase(it);
    Fire(constants::events::TILE_UNLOAD, {{"coords", coords}, {"url", url}});
}

void TileLayer::ClearTiles() {
    for (const auto& coords : GetTileKeys()) {
        RemoveTile(coords);
    }
}

void TileLayer::UpdateContainerTransform(std::int32_t zoom) {
    const double tile_zoom = static_cast<double>(zoom);
    transform_.offset = map_->GetPixelOriginFor(map_->GetCenter(), tile_zoom).MultiplyBy(-1.0);
    transform_.scale = map_->GetZoomScale(tile_zoom, map_->GetZoom());
}

void TileLayer::HandleTileLoaded(const TileDescriptor& coords, std::uint64_t load_id,
                                 bool success, const std::string& reason) {
    const auto it = tiles_.find(coords);
    if (it == tiles_.end() || it->second.load_id != load_id) {
        spdlog::trace("Ignoring load completion of retired tile {}", coords.GetKey());
        return;
    }

    TileElement& tile = it->second;
    if (tile.state != TileState::LOADING) {
        return;
    }

    const std::string url = tile.url;
    if (success) {
        tile.state = TileState::LOADED;
        Fire(constants::events::TILE_LOAD, {{"coords", coords}, {"url", url}});
    } else {
        tile.state = TileState::ERRORED;
        tile.src = constants::tiles::ERROR_PLACEHOLDER_SRC;

        const TileLoadFailure failure{coords, url, reason};
        spdlog::warn("Tile {} failed to load from {}: {}",
                     failure.coords.GetKey(), failure.url,
                     failure.reason.empty() ? std::string("unknown error") : failure.reason);
        Fire(constants::events::TILE_ERROR,
             {{"coords", failure.coords}, {"url", failure.url}, {"reason", failure.reason}});
    }

    load_event_pending_ = true;
    FireLoadIfSettled();
}

void TileLayer::FireLoadIfSettled() {
    if (reconcile_depth_ > 0 || !load_event_pending_ || !map_ || IsLoading()) {
        return;
    }
    load_event_pending_ = false;
    Fire(constants::events::LOAD);
}

} // namespace slippy_map
