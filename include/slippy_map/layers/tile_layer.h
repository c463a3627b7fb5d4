#pragma once

/**
 * @file tile_layer.h
 * @brief Raster tile layer: visible tile set reconciliation and placement
 *
 * The tile layer decides which tile keys must be shown for the current
 * view, where each tile sits inside the tile container, and how the
 * container is transformed. Fetching and decoding images belongs to the
 * host through the TileLoader interface.
 */

#include <slippy_map/layers/layer.h>
#include <slippy_map/math/point.h>
#include <slippy_map/math/tile_grid.h>
#include <slippy_map/constants.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace slippy_map {

struct Configuration;

/**
 * @brief Tile layer options
 */
struct TileLayerOptions {
    /** Tile edge length in pixels */
    double tile_size = constants::tiles::DEFAULT_TILE_SIZE;

    /** Subdomains substituted for {s}; {s} is left alone when empty */
    std::string subdomains;

    /** Lowest zoom level tiles are requested for */
    std::int32_t min_zoom = constants::tiles::DEFAULT_MIN_ZOOM;

    /** Highest zoom level tiles are requested for */
    std::int32_t max_zoom = constants::tiles::DEFAULT_MAX_ZOOM;

    /**
     * @brief Take tile settings from a map configuration
     */
    static TileLayerOptions FromConfiguration(const Configuration& config);
};

/**
 * @brief Per-tile lifecycle state
 *
 * absent -> LOADING -> LOADED, or absent -> LOADING -> ERRORED (shown as
 * the transparent placeholder). A stalled load stays LOADING.
 */
enum class TileState {
    LOADING,  ///< Request handed to the loader
    LOADED,   ///< Image available
    ERRORED   ///< Load failed, placeholder shown
};

/**
 * @brief Displayed tile inside the tile container
 */
struct TileElement {
    TileDescriptor coords;   ///< Wrapped tile coordinates
    Point position;          ///< Top-left corner inside the container: (x, y) * tile_size
    double size = 0.0;       ///< Edge length in pixels
    std::string url;         ///< URL built from the template
    std::string src;         ///< Image source currently shown (url or placeholder)
    TileState state = TileState::LOADING;
    std::uint64_t load_id = 0;  ///< Identity of the load request in flight
};

/**
 * @brief Combined translate + scale transform of the tile container
 */
struct ContainerTransform {
    Point offset;        ///< Translation in pixels
    double scale = 1.0;  ///< Uniform scale

    /**
     * @brief Homogeneous 2D matrix applying scale then translation
     */
    glm::dmat3 ToMatrix() const;

    bool operator==(const ContainerTransform& other) const {
        return offset == other.offset && scale == other.scale;
    }
};

/**
 * @brief Tile load request handed to the host
 */
struct TileLoadRequest {
    TileDescriptor coords;
    std::string url;
};

/**
 * @brief Description of a failed tile load
 *
 * Never thrown: delivered with the "tileerror" event and logged.
 */
struct TileLoadFailure {
    TileDescriptor coords;
    std::string url;
    std::string reason;
};

/**
 * @brief Host-side image loader
 *
 * Each load is independent and unordered. The callback may be invoked
 * synchronously or later, at most once, on the map thread.
 */
class TileLoader {
public:
    /**
     * @brief Completion callback
     *
     * @param success Whether the image loaded
     * @param reason Failure description, empty on success
     */
    using Callback = std::function<void(bool success, const std::string& reason)>;

    virtual ~TileLoader() = default;

    virtual void Load(const TileLoadRequest& request, Callback callback) = 0;
};

/**
 * @brief Loader that queues requests until the host completes them
 *
 * Used by headless hosts, examples and tests.
 */
class DeferredTileLoader : public TileLoader {
public:
    void Load(const TileLoadRequest& request, Callback callback) override;

    /**
     * @brief Complete the oldest pending request for a tile
     *
     * @return bool false if no request for the tile is pending
     */
    bool Complete(const TileDescriptor& coords, bool success, const std::string& reason = "");

    /**
     * @brief Complete every pending request
     *
     * @return std::size_t Number of requests completed
     */
    std::size_t CompleteAll(bool success, const std::string& reason = "");

    std::vector<TileLoadRequest> GetPendingRequests() const;
    std::size_t GetPendingCount() const { return pending_.size(); }

private:
    struct PendingLoad {
        TileLoadRequest request;
        Callback callback;
    };

    std::deque<PendingLoad> pending_;
};

/**
 * @brief Tile layer
 *
 * Reconciles its tiles on OnAdd(), Update() and every "moveend" of the
 * map. Fires "tileloadstart", "tileload", "tileerror", "tileunload" with
 * {"coords", "url"} payloads, and "load" once no tile is loading.
 *
 * Listeners may move the map from inside these events, even while loads
 * complete synchronously: the interrupted pass stops and the nested one
 * leaves the tile set matching the latest view. "load" is held back until
 * the outermost pass has added all of its tiles.
 */
class TileLayer : public Layer {
public:
    /**
     * @brief Constructor
     *
     * @param url_template URL template with {x}, {y}, {z} placeholders
     * @param loader Host image loader
     * @param options Layer options
     * @throws std::invalid_argument if loader is null or options are invalid
     */
    TileLayer(std::string url_template,
              std::shared_ptr<TileLoader> loader,
              TileLayerOptions options = {});

    ~TileLayer() override;

    void OnAdd(MapView& map) override;
    void OnRemove() override;
    void Update() override;

    /**
     * @brief URL of a tile according to the template
     */
    std::string GetTileUrl(const TileDescriptor& coords) const;

    /**
     * @brief Resident tile, nullptr if the tile is not shown
     */
    const TileElement* GetTile(const TileDescriptor& coords) const;

    /**
     * @brief Keys of all resident tiles, sorted
     */
    std::vector<TileDescriptor> GetTileKeys() const;

    std::size_t GetTileCount() const { return tiles_.size(); }

    /**
     * @brief Transform applied to the tile container by the last update
     */
    const ContainerTransform& GetContainerTransform() const { return transform_; }

    /**
     * @brief Add/remove instructions of the last reconciliation
     */
    const TileDiff& GetLastDiff() const { return last_diff_; }

    /**
     * @brief Tile grid zoom of the last reconciliation
     */
    std::optional<std::int32_t> GetTileZoom() const { return tile_zoom_; }

    /**
     * @brief Check whether any resident tile is still loading
     */
    bool IsLoading() const;

    const TileLayerOptions& GetOptions() const { return options_; }
    const std::string& GetUrlTemplate() const { return url_template_; }

private:
    void Reconcile();
    void AddTile(const TileDescriptor& coords);
    void RemoveTile(const TileDescriptor& coords);
    void ClearTiles();
    void UpdateContainerTransform(std::int32_t zoom);
    void FireLoadIfSettled();
    void HandleTileLoaded(const TileDescriptor& coords, std::uint64_t load_id,
                          bool success, const std::string& reason);

    std::string url_template_;
    std::shared_ptr<TileLoader> loader_;
    TileLayerOptions options_;

    std::unordered_map<TileDescriptor, TileElement, TileDescriptorHash> tiles_;
    ContainerTransform transform_;
    TileDiff last_diff_;
    std::optional<std::int32_t> tile_zoom_;

    ListenerId moveend_listener_ = 0;
    std::uint64_t next_load_id_ = 1;

    // Bumped by every reconcile; a pass that sees it change was superseded
    // by a nested one started from an event listener
    std::uint64_t reconcile_generation_ = 0;
    int reconcile_depth_ = 0;
    bool load_event_pending_ = false;
};

} // namespace slippy_map
