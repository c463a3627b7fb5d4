#pragma once

/**
 * @file geojson.h
 * @brief GeoJSON-like feature model and the layer built from it
 *
 * Geometries form a closed variant. GeoJsonLayer turns every Point into a
 * Marker; line strings and polygons are accepted and skipped.
 */

#include <slippy_map/layers/layer.h>
#include <slippy_map/layers/marker.h>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace slippy_map {

/**
 * @brief GeoJSON position, longitude first
 */
struct Position {
    double lng = 0.0;
    double lat = 0.0;

    /**
     * @throws InvalidCoordinate if either value is not finite
     */
    LatLng ToLatLng() const { return LatLng(lat, lng); }
};

struct PointGeometry {
    Position coordinates;
};

struct LineStringGeometry {
    std::vector<Position> coordinates;
};

struct PolygonGeometry {
    std::vector<std::vector<Position>> coordinates;  ///< Outer ring first, then holes
};

using Geometry = std::variant<PointGeometry, LineStringGeometry, PolygonGeometry>;

/**
 * @brief Name of a geometry type as written in GeoJSON ("Point", ...)
 */
const char* GetGeometryTypeName(const Geometry& geometry);

using FeatureProperties = std::unordered_map<std::string, std::string>;

struct Feature {
    Geometry geometry;
    FeatureProperties properties;
};

struct FeatureCollection {
    std::vector<Feature> features;
};

using GeoJsonObject = std::variant<Feature, FeatureCollection>;

/**
 * @brief GeoJSON layer options
 */
struct GeoJsonOptions {
    /** Called once per created marker with the feature it came from */
    std::function<void(const Feature&, Marker&)> on_each_feature;
};

/**
 * @brief Layer group holding one Marker per Point feature
 */
class GeoJsonLayer : public LayerGroup {
public:
    explicit GeoJsonLayer(GeoJsonOptions options = {});

    /**
     * @brief Construct and add data
     *
     * @throws InvalidCoordinate if a Point carries non-finite coordinates
     */
    explicit GeoJsonLayer(const GeoJsonObject& data, GeoJsonOptions options = {});

    /**
     * @brief Add features; markers join the map immediately if attached
     *
     * @return std::size_t Number of markers created
     * @throws InvalidCoordinate if a Point carries non-finite coordinates
     */
    std::size_t AddData(const GeoJsonObject& data);

private:
    std::size_t AddFeature(const Feature& feature);

    GeoJsonOptions options_;
};

} // namespace slippy_map
