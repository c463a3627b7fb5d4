#pragma once

/**
 * @file layer.h
 * @brief Base class of everything that can be attached to a map
 */

#include <slippy_map/core/evented.h>
#include <memory>
#include <vector>

namespace slippy_map {

class MapView;

/**
 * @brief Attachable map layer
 *
 * The map owns layer registration: MapView::AddLayer() calls OnAdd(),
 * MapView::RemoveLayer() calls OnRemove(), and every SetView() calls
 * Update() on each attached layer. Layers are held by shared_ptr.
 */
class Layer : public Evented, public std::enable_shared_from_this<Layer> {
public:
    ~Layer() override = default;

    /**
     * @brief Called when the layer is attached to a map
     *
     * @param map Map the layer was added to; outlives the attachment
     */
    virtual void OnAdd(MapView& map) = 0;

    /**
     * @brief Called when the layer is detached
     */
    virtual void OnRemove() = 0;

    /**
     * @brief Called after every view reset
     */
    virtual void Update() {}

    /**
     * @brief Map the layer is attached to, nullptr when detached
     */
    MapView* GetMap() const { return map_; }

protected:
    MapView* map_ = nullptr;
};

/**
 * @brief Layer that adds and removes a set of layers together
 */
class LayerGroup : public Layer {
public:
    LayerGroup() = default;
    explicit LayerGroup(std::vector<std::shared_ptr<Layer>> layers);

    void OnAdd(MapView& map) override;
    void OnRemove() override;

    /**
     * @brief Add a layer to the group (and to the map if attached)
     */
    void AddLayer(std::shared_ptr<Layer> layer);

    /**
     * @brief Remove a layer from the group (and from the map if attached)
     */
    void RemoveLayer(const std::shared_ptr<Layer>& layer);

    const std::vector<std::shared_ptr<Layer>>& GetLayers() const { return layers_; }

private:
    std::vector<std::shared_ptr<Layer>> layers_;
};

} // namespace slippy_map
