#include <slippy_map/slippy_map.h>
#include <slippy_map/constants.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>

// Headless host: a fixed 800x600 viewport, a manually driven frame clock
// and a loader whose requests are completed by hand.
int main() {
    try {
        std::cout << "Slippy Map Basic Example\n";
        std::cout << "========================\n\n";

        std::cout << "Library Version: " << slippy_map::LibraryInfo::GetVersion() << "\n";
        std::cout << "Build Info: " << slippy_map::LibraryInfo::GetBuildInfo() << "\n";
        std::cout << "Dependencies: " << slippy_map::LibraryInfo::GetDependencyInfo() << "\n\n";

        slippy_map::Configuration config;
        config.initial_latitude = 51.505;
        config.initial_longitude = -0.09;
        config.initial_zoom = 12.0;
        config.log_level = "debug";
        slippy_map::ConfigureLogging(config);

        slippy_map::FixedViewportHost host(slippy_map::Point(800.0, 600.0));
        slippy_map::ManualFrameScheduler scheduler;

        // Create a map centered on London
        slippy_map::MapView map(config, host, scheduler);

        auto loader = std::make_shared<slippy_map::DeferredTileLoader>();
        auto tiles = std::make_shared<slippy_map::TileLayer>(
            config.tile_url_template, loader,
            slippy_map::TileLayerOptions::FromConfiguration(config));

        tiles->On("tileloadstart tileunload", [](const slippy_map::Event& event) {
            const auto* coords = event.Get<slippy_map::TileDescriptor>("coords");
            spdlog::info("{} {}", event.type, coords ? coords->GetKey() : std::string("?"));
        });
        tiles->On(slippy_map::constants::events::LOAD, [](const slippy_map::Event&) {
            spdlog::info("All visible tiles loaded");
        });
        map.AddLayer(tiles);

        auto marker = std::make_shared<slippy_map::Marker>(slippy_map::LatLng(51.5, -0.09));
        map.AddLayer(marker);

        // Add a GeoJSON point
        slippy_map::Feature feature;
        feature.geometry = slippy_map::PointGeometry{{-0.1, 51.51}};
        feature.properties["name"] = "GeoJSON Point";

        slippy_map::GeoJsonOptions geojson_options;
        geojson_options.on_each_feature = [](const slippy_map::Feature& f, slippy_map::Marker& m) {
            const auto point = m.GetLatLng();
            spdlog::info("Feature '{}' at {}", f.properties.at("name"), point.ToString());
        };
        map.AddLayer(std::make_shared<slippy_map::GeoJsonLayer>(feature, geojson_options));

        std::cout << "Center " << map.GetCenter().ToString() << " zoom " << map.GetZoom() << "\n";
        std::cout << "Pixel origin " << map.GetPixelOrigin().ToString() << "\n";
        std::cout << "Tiles requested: " << loader->GetPendingCount() << "\n";
        if (const auto point = marker->GetContainerPoint()) {
            std::cout << "Marker container point " << point->ToString() << "\n";
        }

        const std::size_t loaded = loader->CompleteAll(true);
        std::cout << "Tiles loaded: " << loaded << "\n\n";

        // Animated pan, one frame at a time
        map.PanBy(slippy_map::Point(200.0, 100.0));
        int frames = 0;
        while (map.IsPanning()) {
            scheduler.AdvanceBy(std::chrono::duration<double>(slippy_map::constants::view::FRAME_INTERVAL));
            ++frames;
        }
        std::cout << "Pan finished after " << frames << " frames, pane at "
                  << map.GetPanePosition().ToString() << "\n";

        // Settle the view on the new center
        const slippy_map::LatLng new_center = map.ContainerPointToLatLng(
            map.GetSize().DivideBy(2.0).Add(slippy_map::Point(200.0, 100.0)));
        map.SetView(new_center, map.GetZoom());
        std::cout << "New center " << map.GetCenter().ToString()
                  << ", " << tiles->GetTileCount() << " tiles resident, "
                  << loader->GetPendingCount() << " pending\n";

        loader->CompleteAll(false, "network unavailable");
        std::cout << "\nExample completed successfully\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
