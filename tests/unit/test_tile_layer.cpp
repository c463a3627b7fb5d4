#include <gtest/gtest.h>
#include "slippy_map/layers/tile_layer.h"
#include "slippy_map/core/map_view.h"
#include "slippy_map/slippy_map.h"
#include "slippy_map/constants.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <vector>

using namespace slippy_map;

class TileLayerTest : public ::testing::Test {
protected:
    void SetUp() override {
        map_ = std::make_unique<MapView>(host_, scheduler_, LatLng(0.0, 0.0), 2.0);
        loader_ = std::make_shared<DeferredTileLoader>();
        layer_ = std::make_shared<TileLayer>("https://x/{z}/{x}/{y}.png", loader_);

        layer_->On("tileloadstart tileload tileerror tileunload load", [this](const Event& event) {
            ++event_counts_[event.type];
        });
    }

    void TearDown() override {
        layer_.reset();
        map_.reset();
    }

    int Count(const std::string& type) const {
        const auto it = event_counts_.find(type);
        return it == event_counts_.end() ? 0 : it->second;
    }

    // Tiles at zoom 2 for a 256x256 viewport centered on (0, 0):
    // pixel bounds [-128, 128] on both axes cover columns -1..1 (wrapped to 3, 0, 1)
    // and rows -1..1
    static std::vector<TileDescriptor> InitialTiles() {
        std::vector<TileDescriptor> tiles;
        for (std::int32_t x : {0, 1, 3}) {
            for (std::int32_t y : {-1, 0, 1}) {
                tiles.emplace_back(x, y, 2);
            }
        }
        std::sort(tiles.begin(), tiles.end());
        return tiles;
    }

    FixedViewportHost host_{Point(256.0, 256.0)};
    ManualFrameScheduler scheduler_;
    std::unique_ptr<MapView> map_;
    std::shared_ptr<DeferredTileLoader> loader_;
    std::shared_ptr<TileLayer> layer_;
    std::map<std::string, int> event_counts_;
};

TEST_F(TileLayerTest, RejectsInvalidConstruction) {
    EXPECT_THROW(TileLayer("{z}/{x}/{y}", nullptr), std::invalid_argument);

    TileLayerOptions options;
    options.tile_size = 0.0;
    EXPECT_THROW(TileLayer("{z}/{x}/{y}", loader_, options), std::invalid_argument);

    options.tile_size = 256.0;
    options.min_zoom = 5;
    options.max_zoom = 4;
    EXPECT_THROW(TileLayer("{z}/{x}/{y}", loader_, options), std::invalid_argument);
}

TEST_F(TileLayerTest, AddRequestsVisibleTiles) {
    map_->AddLayer(layer_);

    EXPECT_EQ(layer_->GetTileKeys(), InitialTiles());
    EXPECT_EQ(loader_->GetPendingCount(), 9u);
    EXPECT_EQ(Count("tileloadstart"), 9);
    EXPECT_TRUE(layer_->IsLoading());
    ASSERT_TRUE(layer_->GetTileZoom().has_value());
    EXPECT_EQ(*layer_->GetTileZoom(), 2);

    for (const auto& request : loader_->GetPendingRequests()) {
        EXPECT_EQ(request.url, TileGrid::GetTileURL(request.coords, "https://x/{z}/{x}/{y}.png"));
    }
}

TEST_F(TileLayerTest, TilesArePlacedOnTheGrid) {
    map_->AddLayer(layer_);

    const TileElement* tile = layer_->GetTile(TileDescriptor(3, -1, 2));
    ASSERT_NE(tile, nullptr);
    EXPECT_EQ(tile->position, Point(768.0, -256.0));
    EXPECT_DOUBLE_EQ(tile->size, 256.0);
    EXPECT_EQ(tile->url, "https://x/2/3/-1.png");
    EXPECT_EQ(tile->src, tile->url);
    EXPECT_EQ(tile->state, TileState::LOADING);

    EXPECT_EQ(layer_->GetTile(TileDescriptor(2, 0, 2)), nullptr);
}

TEST_F(TileLayerTest, ContainerTransformAtIntegerZoom) {
    map_->AddLayer(layer_);

    const ContainerTransform& transform = layer_->GetContainerTransform();
    EXPECT_EQ(transform.offset, map_->GetPixelOrigin().MultiplyBy(-1.0));
    EXPECT_DOUBLE_EQ(transform.scale, 1.0);

    const glm::dmat3 matrix = transform.ToMatrix();
    EXPECT_DOUBLE_EQ(matrix[0][0], 1.0);
    EXPECT_DOUBLE_EQ(matrix[1][1], 1.0);
    EXPECT_DOUBLE_EQ(matrix[2][0], 128.0);
    EXPECT_DOUBLE_EQ(matrix[2][1], 128.0);
    EXPECT_DOUBLE_EQ(matrix[2][2], 1.0);
}

TEST_F(TileLayerTest, FractionalZoomUsesRoundedGridAndScalesContainer) {
    map_->AddLayer(layer_);

    map_->SetView(LatLng(0.0, 0.0), 2.4);
    ASSERT_TRUE(layer_->GetTileZoom().has_value());
    EXPECT_EQ(*layer_->GetTileZoom(), 2);
    EXPECT_NEAR(layer_->GetContainerTransform().scale, std::pow(2.0, -0.4), 1e-12);

    map_->SetView(LatLng(0.0, 0.0), 2.5);
    EXPECT_EQ(*layer_->GetTileZoom(), 3);
    EXPECT_NEAR(layer_->GetContainerTransform().scale, std::pow(2.0, 0.5), 1e-12);

    for (const auto& coords : layer_->GetTileKeys()) {
        EXPECT_EQ(coords.z, 3);
    }
}

TEST_F(TileLayerTest, SuccessfulLoadsFireLoadOnce) {
    map_->AddLayer(layer_);

    EXPECT_EQ(loader_->CompleteAll(true), 9u);

    EXPECT_EQ(Count("tileload"), 9);
    EXPECT_EQ(Count("load"), 1);
    EXPECT_FALSE(layer_->IsLoading());
    for (const auto& coords : layer_->GetTileKeys()) {
        EXPECT_EQ(layer_->GetTile(coords)->state, TileState::LOADED);
    }
}

TEST_F(TileLayerTest, FailedLoadShowsPlaceholder) {
    std::string reason;
    std::string url;
    layer_->On(constants::events::TILE_ERROR, [&](const Event& event) {
        if (const auto* r = event.Get<std::string>("reason")) reason = *r;
        if (const auto* u = event.Get<std::string>("url")) url = *u;
    });
    map_->AddLayer(layer_);

    EXPECT_NO_THROW(loader_->Complete(TileDescriptor(0, 0, 2), false, "HTTP 404"));

    const TileElement* tile = layer_->GetTile(TileDescriptor(0, 0, 2));
    ASSERT_NE(tile, nullptr);
    EXPECT_EQ(tile->state, TileState::ERRORED);
    EXPECT_EQ(tile->src, constants::tiles::ERROR_PLACEHOLDER_SRC);
    EXPECT_EQ(tile->url, "https://x/2/0/0.png");
    EXPECT_EQ(Count("tileerror"), 1);
    EXPECT_EQ(reason, "HTTP 404");
    EXPECT_EQ(url, "https://x/2/0/0.png");

    // Other tiles are unaffected and still loading
    EXPECT_EQ(Count("load"), 0);
    EXPECT_EQ(layer_->GetTile(TileDescriptor(1, 0, 2))->state, TileState::LOADING);

    // Errored tiles count as settled
    loader_->CompleteAll(true);
    EXPECT_EQ(Count("load"), 1);
    EXPECT_EQ(layer_->GetTile(TileDescriptor(0, 0, 2))->state, TileState::ERRORED);
}

TEST_F(TileLayerTest, ReconcilingUnchangedViewIsNoop) {
    map_->AddLayer(layer_);
    const auto keys = layer_->GetTileKeys();

    layer_->Update();

    EXPECT_TRUE(layer_->GetLastDiff().IsEmpty());
    EXPECT_EQ(layer_->GetTileKeys(), keys);
    EXPECT_EQ(loader_->GetPendingCount(), 9u);
    EXPECT_EQ(Count("tileloadstart"), 9);
    EXPECT_EQ(Count("tileunload"), 0);
}

TEST_F(TileLayerTest, ShiftingViewRetiresAndAddsColumns) {
    map_->AddLayer(layer_);

    // Move the center one tile east: origin x becomes 128, columns 0..2
    const LatLng east = map_->ContainerPointToLatLng(Point(128.0 + 256.0, 128.0));
    map_->SetView(east, 2.0);

    std::vector<TileDescriptor> expected;
    for (std::int32_t x : {0, 1, 2}) {
        for (std::int32_t y : {-1, 0, 1}) {
            expected.emplace_back(x, y, 2);
        }
    }
    EXPECT_EQ(layer_->GetTileKeys(), expected);
    EXPECT_EQ(Count("tileunload"), 3);
    EXPECT_EQ(Count("tileloadstart"), 12);
}

TEST_F(TileLayerTest, CompletionForRetiredTileIsIgnored) {
    map_->AddLayer(layer_);

    map_->SetView(LatLng(0.0, 0.0), 3.0);
    EXPECT_EQ(Count("tileunload"), 9);
    EXPECT_EQ(layer_->GetTile(TileDescriptor(0, 0, 2)), nullptr);

    EXPECT_TRUE(loader_->Complete(TileDescriptor(0, 0, 2), true));
    EXPECT_TRUE(loader_->Complete(TileDescriptor(1, 0, 2), false, "timeout"));
    EXPECT_EQ(Count("tileload"), 0);
    EXPECT_EQ(Count("tileerror"), 0);
    EXPECT_EQ(layer_->GetTile(TileDescriptor(0, 0, 2)), nullptr);
}

TEST_F(TileLayerTest, ReaddedTileIgnoresStaleCompletion) {
    map_->AddLayer(layer_);

    // Retire every tile, then bring the same keys back
    map_->SetView(LatLng(0.0, 0.0), 3.0);
    map_->SetView(LatLng(0.0, 0.0), 2.0);
    ASSERT_NE(layer_->GetTile(TileDescriptor(0, 0, 2)), nullptr);

    // The oldest pending request for the key belongs to the retired tile
    ASSERT_TRUE(loader_->Complete(TileDescriptor(0, 0, 2), true));
    EXPECT_EQ(layer_->GetTile(TileDescriptor(0, 0, 2))->state, TileState::LOADING);

    ASSERT_TRUE(loader_->Complete(TileDescriptor(0, 0, 2), true));
    EXPECT_EQ(layer_->GetTile(TileDescriptor(0, 0, 2))->state, TileState::LOADED);
}

TEST_F(TileLayerTest, ZoomOutsideRangeClearsTiles) {
    TileLayerOptions options;
    options.max_zoom = 2;
    auto limited = std::make_shared<TileLayer>("{z}/{x}/{y}", loader_, options);
    map_->AddLayer(limited);
    ASSERT_EQ(limited->GetTileCount(), 9u);

    map_->SetZoom(3.0);
    EXPECT_EQ(limited->GetTileCount(), 0u);
    EXPECT_FALSE(limited->GetTileZoom().has_value());

    map_->SetZoom(2.0);
    EXPECT_EQ(limited->GetTileCount(), 9u);
}

TEST_F(TileLayerTest, RemoveDetachesAndClears) {
    const std::size_t listeners_before = map_->GetListenerCount(constants::events::MOVEEND);
    map_->AddLayer(layer_);
    EXPECT_EQ(map_->GetListenerCount(constants::events::MOVEEND), listeners_before + 1);

    map_->RemoveLayer(layer_);
    EXPECT_EQ(layer_->GetTileCount(), 0u);
    EXPECT_EQ(Count("tileunload"), 9);
    EXPECT_EQ(layer_->GetMap(), nullptr);
    EXPECT_EQ(map_->GetListenerCount(constants::events::MOVEEND), listeners_before);

    // View changes no longer reach the layer; late completions are ignored
    map_->SetView(LatLng(10.0, 10.0), 4.0);
    EXPECT_EQ(layer_->GetTileCount(), 0u);
    loader_->CompleteAll(true);
    EXPECT_EQ(Count("tileload"), 0);
}

TEST_F(TileLayerTest, CompletionAfterLayerDestroyedIsSafe) {
    map_->AddLayer(layer_);
    map_->RemoveLayer(layer_);
    layer_.reset();

    EXPECT_NO_THROW(loader_->CompleteAll(true));
}

TEST_F(TileLayerTest, SubdomainsRotateAcrossTiles) {
    TileLayerOptions options;
    options.subdomains = "abc";
    TileLayer layer("https://{s}.tile.example.org/{z}/{x}/{y}.png", loader_, options);

    EXPECT_EQ(layer.GetTileUrl(TileDescriptor(0, 0, 2)), "https://a.tile.example.org/2/0/0.png");
    EXPECT_EQ(layer.GetTileUrl(TileDescriptor(1, 0, 2)), "https://b.tile.example.org/2/1/0.png");
    EXPECT_EQ(layer.GetTileUrl(TileDescriptor(1, 1, 2)), "https://c.tile.example.org/2/1/1.png");
}

TEST_F(TileLayerTest, OptionsFromConfiguration) {
    Configuration config;
    config.tile_size = 512.0;
    config.tile_subdomains = "xy";
    config.min_zoom = 1;
    config.max_zoom = 10;

    const TileLayerOptions options = TileLayerOptions::FromConfiguration(config);
    EXPECT_DOUBLE_EQ(options.tile_size, 512.0);
    EXPECT_EQ(options.subdomains, "xy");
    EXPECT_EQ(options.min_zoom, 1);
    EXPECT_EQ(options.max_zoom, 10);
}

/**
 * @brief Loader that completes every request before returning
 */
class ImmediateTileLoader : public TileLoader {
public:
    explicit ImmediateTileLoader(bool success = true) : success_(success) {}

    void Load(const TileLoadRequest&, Callback callback) override {
        ++requests_;
        callback(success_, success_ ? std::string() : std::string("offline"));
    }

    int GetRequestCount() const { return requests_; }

private:
    bool success_;
    int requests_ = 0;
};

class ImmediateTileLayerTest : public TileLayerTest {
protected:
    void UseImmediateLoader(bool success = true) {
        immediate_ = std::make_shared<ImmediateTileLoader>(success);
        layer_ = std::make_shared<TileLayer>("https://x/{z}/{x}/{y}.png", immediate_);
        layer_->On("tileloadstart tileload tileerror tileunload load", [this](const Event& event) {
            ++event_counts_[event.type];
        });
    }

    std::vector<TileDescriptor> RequiredTiles() const {
        const std::int32_t zoom = static_cast<std::int32_t>(std::floor(map_->GetZoom() + 0.5));
        auto tiles = TileGrid::EnumerateTiles(
            TileGrid::ComputeTileRange(map_->GetPixelBounds(), constants::tiles::DEFAULT_TILE_SIZE), zoom);
        std::sort(tiles.begin(), tiles.end());
        return tiles;
    }

    std::shared_ptr<ImmediateTileLoader> immediate_;
};

TEST_F(ImmediateTileLayerTest, SynchronousLoadsFireLoadOncePerReconcile) {
    UseImmediateLoader();
    map_->AddLayer(layer_);

    EXPECT_EQ(Count("tileload"), 9);
    EXPECT_EQ(Count("load"), 1);
    EXPECT_FALSE(layer_->IsLoading());

    map_->SetView(LatLng(0.0, 0.0), 3.0);
    EXPECT_EQ(Count("load"), 2);
}

TEST_F(ImmediateTileLayerTest, SynchronousFailuresFireLoadOnce) {
    UseImmediateLoader(false);
    map_->AddLayer(layer_);

    EXPECT_EQ(Count("tileerror"), 9);
    EXPECT_EQ(Count("load"), 1);
}

TEST_F(ImmediateTileLayerTest, ViewChangeFromLoadListenerLeavesCurrentTiles) {
    UseImmediateLoader();
    bool moved = false;
    layer_->On(constants::events::LOAD, [&](const Event&) {
        if (!moved) {
            moved = true;
            map_->SetView(LatLng(-33.0, 151.0), 5.0);
        }
    });
    map_->AddLayer(layer_);

    ASSERT_TRUE(moved);
    EXPECT_EQ(layer_->GetTileKeys(), RequiredTiles());
    EXPECT_EQ(*layer_->GetTileZoom(), 5);

    layer_->Update();
    EXPECT_TRUE(layer_->GetLastDiff().IsEmpty());
}

TEST_F(ImmediateTileLayerTest, ViewChangeFromTileLoadListenerStopsStalePass) {
    UseImmediateLoader();
    bool moved = false;
    layer_->On(constants::events::TILE_LOAD, [&](const Event&) {
        if (!moved) {
            moved = true;
            map_->SetView(LatLng(-33.0, 151.0), 5.0);
        }
    });
    map_->AddLayer(layer_);

    ASSERT_TRUE(moved);
    EXPECT_EQ(layer_->GetTileKeys(), RequiredTiles());
    for (const auto& coords : layer_->GetTileKeys()) {
        EXPECT_EQ(coords.z, 5);
        EXPECT_EQ(layer_->GetTile(coords)->state, TileState::LOADED);
    }
    EXPECT_EQ(*layer_->GetTileZoom(), 5);
    EXPECT_EQ(Count("load"), 1);

    // Only the first zoom 2 tile was requested before the view moved
    EXPECT_EQ(immediate_->GetRequestCount(), 1 + static_cast<int>(RequiredTiles().size()));

    layer_->Update();
    EXPECT_TRUE(layer_->GetLastDiff().IsEmpty());
    EXPECT_EQ(layer_->GetTileKeys(), RequiredTiles());
}

TEST_F(ImmediateTileLayerTest, ViewChangeFromLoadStartListenerSkipsRetiredRequest) {
    UseImmediateLoader();
    bool moved = false;
    layer_->On(constants::events::TILE_LOAD_START, [&](const Event&) {
        if (!moved) {
            moved = true;
            map_->SetView(LatLng(-33.0, 151.0), 5.0);
        }
    });
    map_->AddLayer(layer_);

    EXPECT_EQ(layer_->GetTileKeys(), RequiredTiles());
    EXPECT_EQ(immediate_->GetRequestCount(), static_cast<int>(RequiredTiles().size()));
}
