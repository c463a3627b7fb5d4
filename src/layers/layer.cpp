/**
 * @file layer.cpp
 * @brief Layer base and layer group implementation
 */

#include <slippy_map/layers/layer.h>
#include <slippy_map/core/map_view.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace slippy_map {

LayerGroup::LayerGroup(std::vector<std::shared_ptr<Layer>> layers) {
    for (auto& layer : layers) {
        AddLayer(std::move(layer));
    }
}

void LayerGroup::OnAdd(MapView& map) {
    map_ = &map;
    for (const auto& layer : layers_) {
        map.AddLayer(layer);
    }
}

void LayerGroup::OnRemove() {
    if (!map_) {
        return;
    }
    MapView* map = map_;
    map_ = nullptr;
    for (const auto& layer : layers_) {
        map->RemoveLayer(layer);
    }
}

void LayerGroup::AddLayer(std::shared_ptr<Layer> layer) {
    if (!layer) {
        throw std::invalid_argument("Cannot add a null layer to a group");
    }
    if (std::find(layers_.begin(), layers_.end(), layer) != layers_.end()) {
        return;
    }

    layers_.push_back(layer);
    if (map_) {
        map_->AddLayer(std::move(layer));
    }
}

void LayerGroup::RemoveLayer(const std::shared_ptr<Layer>& layer) {
    const auto it = std::find(layers_.begin(), layers_.end(), layer);
    if (it == layers_.end()) {
        return;
    }

    const std::shared_ptr<Layer> removed = *it;
    layers_.erase(it);
    if (map_) {
        map_->RemoveLayer(removed);
    }
}

} // namespace slippy_map
