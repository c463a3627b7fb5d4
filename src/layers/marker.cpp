/**
 * @file marker.cpp
 * @brief Marker layer implementation
 */

#include <slippy_map/layers/marker.h>
#include <slippy_map/core/map_view.h>
#include <slippy_map/constants.h>
#include <spdlog/spdlog.h>

namespace slippy_map {

Marker::Marker(const LatLng& latlng) : latlng_(latlng) {}

Marker::~Marker() {
    if (map_) {
        map_->OffContext(this);
    }
}

void Marker::OnAdd(MapView& map) {
    map_ = &map;
    Update();
    moveend_listener_ = map.On(constants::events::MOVEEND,
                               [this](const Event&) { Update(); },
                               this);
}

void Marker::OnRemove() {
    if (!map_) {
        return;
    }
    map_->Off(constants::events::MOVEEND, moveend_listener_);
    moveend_listener_ = 0;
    map_ = nullptr;
    container_point_.reset();
}

void Marker::Update() {
    if (!map_) {
        return;
    }
    container_point_ = map_->LatLngToContainerPoint(latlng_);
    spdlog::trace("Marker {} placed at ({}, {})",
                  latlng_.ToString(), container_point_->x, container_point_->y);
}

void Marker::SetLatLng(const LatLng& latlng) {
    latlng_ = latlng;
    Update();
}

} // namespace slippy_map
