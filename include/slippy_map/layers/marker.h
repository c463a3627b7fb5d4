#pragma once

/**
 * @file marker.h
 * @brief Point marker placement
 */

#include <slippy_map/layers/layer.h>
#include <slippy_map/coordinates/lat_lng.h>
#include <slippy_map/math/point.h>
#include <optional>

namespace slippy_map {

/**
 * @brief Layer anchored at one geographic location
 *
 * Only computes where the marker sits in the container; drawing the icon
 * is up to the host. The container point is refreshed on every view reset
 * and every "moveend".
 */
class Marker : public Layer {
public:
    explicit Marker(const LatLng& latlng);
    ~Marker() override;

    void OnAdd(MapView& map) override;
    void OnRemove() override;
    void Update() override;

    /**
     * @brief Move the marker and refresh its placement
     */
    void SetLatLng(const LatLng& latlng);

    const LatLng& GetLatLng() const { return latlng_; }

    /**
     * @brief Container pixel of the anchor, empty while detached
     */
    std::optional<Point> GetContainerPoint() const { return container_point_; }

private:
    LatLng latlng_;
    std::optional<Point> container_point_;
    ListenerId moveend_listener_ = 0;
};

} // namespace slippy_map
