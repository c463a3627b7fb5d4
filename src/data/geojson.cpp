/**
 * @file geojson.cpp
 * @brief GeoJSON layer implementation
 */

#include <slippy_map/data/geojson.h>
#include <slippy_map/util/overloaded.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace slippy_map {

const char* GetGeometryTypeName(const Geometry& geometry) {
    return std::visit(overloaded{
        [](const PointGeometry&) { return "Point"; },
        [](const LineStringGeometry&) { return "LineString"; },
        [](const PolygonGeometry&) { return "Polygon"; }
    }, geometry);
}

GeoJsonLayer::GeoJsonLayer(GeoJsonOptions options) : options_(std::move(options)) {}

GeoJsonLayer::GeoJsonLayer(const GeoJsonObject& data, GeoJsonOptions options)
    : options_(std::move(options)) {
    AddData(data);
}

std::size_t GeoJsonLayer::AddData(const GeoJsonObject& data) {
    return std::visit(overloaded{
        [this](const Feature& feature) { return AddFeature(feature); },
        [this](const FeatureCollection& collection) {
            std::size_t created = 0;
            for (const auto& feature : collection.features) {
                created += AddFeature(feature);
            }
            return created;
        }
    }, data);
}

std::size_t GeoJsonLayer::AddFeature(const Feature& feature) {
    return std::visit(overloaded{
        [&](const PointGeometry& point) -> std::size_t {
            auto marker = std::make_shared<Marker>(point.coordinates.ToLatLng());
            if (options_.on_each_feature) {
                options_.on_each_feature(feature, *marker);
            }
            AddLayer(std::move(marker));
            return 1;
        },
        [](const LineStringGeometry& line) -> std::size_t {
            spdlog::debug("Skipping LineString geometry with {} positions", line.coordinates.size());
            return 0;
        },
        [](const PolygonGeometry& polygon) -> std::size_t {
            spdlog::debug("Skipping Polygon geometry with {} rings", polygon.coordinates.size());
            return 0;
        }
    }, feature.geometry);
}

} // namespace slippy_map
