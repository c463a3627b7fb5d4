/**
 * @file map_view.cpp
 * @brief Map view state implementation
 */

#include <slippy_map/core/map_view.h>
#include <slippy_map/layers/layer.h>
#include <slippy_map/math/projection.h>
#include <slippy_map/slippy_map.h>
#include <slippy_map/constants.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace slippy_map {

namespace {
    LatLng ValidatedCenter(const Configuration& config) {
        config.Validate();
        return config.GetInitialCenter();
    }
}

MapView::MapView(ViewportHost& host, FrameScheduler& scheduler, const LatLng& center, double zoom)
    : host_(host)
    , scheduler_(scheduler)
    , center_(center)
    , zoom_(zoom)
    , viewport_size_(host.GetSize())
    , default_pan_duration_(constants::view::DEFAULT_PAN_DURATION) {
    spdlog::info("Creating map view {}x{} at {} zoom {}",
                 viewport_size_.x, viewport_size_.y, center.ToString(), zoom);
    SetView(center, zoom);
}

MapView::MapView(const Configuration& config, ViewportHost& host, FrameScheduler& scheduler)
    : MapView(host, scheduler, ValidatedCenter(config), config.initial_zoom) {
    default_pan_duration_ = config.pan_duration;
}

MapView::~MapView() {
    if (pan_animation_) {
        pan_animation_->Stop();
    }

    // Groups detach their children through RemoveLayer, so remove one at a time
    while (!layers_.empty()) {
        RemoveLayer(layers_.back());
    }
}

// ============================================================================
// View Control
// ============================================================================

void MapView::SetView(const LatLng& center, double zoom) {
    center_ = center;
    zoom_ = zoom;
    pixel_origin_ = GetPixelOriginFor(center_, zoom_);

    spdlog::debug("SetView {} zoom {} -> pixel origin ({}, {})",
                  center_.ToString(), zoom_, pixel_origin_.x, pixel_origin_.y);

    ResetView();
}

void MapView::SetZoom(double zoom) {
    SetView(center_, zoom);
}

void MapView::ZoomIn(double delta) {
    SetZoom(zoom_ + delta);
}

void MapView::ZoomOut(double delta) {
    SetZoom(zoom_ - delta);
}

void MapView::PanBy(const Point& offset, const PanOptions& options) {
    const Point new_pos = map_pane_.position.Subtract(offset);

    if (options.animate) {
        if (!pan_animation_) {
            pan_animation_ = std::make_unique<PosAnimation>(scheduler_);
        }
        pan_animation_->Run(map_pane_, new_pos, options.duration.value_or(default_pan_duration_));
    } else {
        if (pan_animation_) {
            pan_animation_->Stop();
        }
        map_pane_.position = new_pos;
    }

    Fire(constants::events::MOVEEND, {{"offset", offset}});
}

void MapView::PanTo(const LatLng& latlng, const PanOptions& options) {
    const Point from = LatLngToContainerPoint(center_);
    const Point to = LatLngToContainerPoint(latlng);
    PanBy(to.Subtract(from), options);
}

void MapView::InvalidateSize() {
    const Point new_size = host_.GetSize();
    if (new_size == viewport_size_) {
        return;
    }

    const Point old_size = viewport_size_;
    viewport_size_ = new_size;
    pixel_origin_ = GetPixelOriginFor(center_, zoom_);

    spdlog::debug("Viewport resized from {}x{} to {}x{}",
                  old_size.x, old_size.y, new_size.x, new_size.y);

    Fire(constants::events::RESIZE, {{"old_size", old_size}, {"new_size", new_size}});
    Fire(constants::events::MOVEEND);
}

void MapView::ResetView() {
    if (pan_animation_) {
        pan_animation_->Stop();
    }
    map_pane_.position = Point(0.0, 0.0);

    UpdateLayers();
    Fire(constants::events::MOVEEND, {{"center", center_}, {"zoom", zoom_}});
}

void MapView::UpdateLayers() {
    // Layers may detach themselves or others while updating
    const auto layers = layers_;
    for (const auto& layer : layers) {
        if (HasLayer(layer)) {
            layer->Update();
        }
    }
}

// ============================================================================
// Projection and Coordinate Conversion
// ============================================================================

Point MapView::Project(const LatLng& latlng) const {
    return Project(latlng, zoom_);
}

Point MapView::Project(const LatLng& latlng, double zoom) const {
    return WebMercatorProjection::ProjectToPixels(latlng, zoom);
}

LatLng MapView::Unproject(const Point& point) const {
    return Unproject(point, zoom_);
}

LatLng MapView::Unproject(const Point& point, double zoom) const {
    return WebMercatorProjection::UnprojectFromPixels(point, zoom);
}

Point MapView::LatLngToContainerPoint(const LatLng& latlng) const {
    return Project(latlng).Subtract(pixel_origin_).Round();
}

LatLng MapView::ContainerPointToLatLng(const Point& point) const {
    return Unproject(point.Add(pixel_origin_));
}

Bounds MapView::GetPixelBounds() const {
    return Bounds(pixel_origin_, pixel_origin_.Add(viewport_size_));
}

double MapView::GetZoomScale(double to_zoom) const {
    return GetZoomScale(to_zoom, zoom_);
}

double MapView::GetZoomScale(double to_zoom, double from_zoom) const {
    return WebMercatorProjection::Scale(to_zoom) / WebMercatorProjection::Scale(from_zoom);
}

Point MapView::GetPixelOriginFor(const LatLng& center, double zoom) const {
    return Project(center, zoom).Subtract(viewport_size_.DivideBy(2.0));
}

// ============================================================================
// Layer Management
// ============================================================================

void MapView::AddLayer(std::shared_ptr<Layer> layer) {
    if (!layer) {
        throw std::invalid_argument("Cannot add a null layer");
    }
    if (HasLayer(layer)) {
        return;
    }

    layers_.push_back(layer);
    layer->OnAdd(*this);
    spdlog::debug("Layer added, {} layer(s) attached", layers_.size());
}

void MapView::RemoveLayer(const std::shared_ptr<Layer>& layer) {
    const auto it = std::find(layers_.begin(), layers_.end(), layer);
    if (it == layers_.end()) {
        return;
    }

    // Keep the layer alive through OnRemove even if the caller drops it
    const std::shared_ptr<Layer> removed = *it;
    layers_.erase(it);
    removed->OnRemove();
    spdlog::debug("Layer removed, {} layer(s) attached", layers_.size());
}

bool MapView::HasLayer(const std::shared_ptr<Layer>& layer) const {
    return std::find(layers_.begin(), layers_.end(), layer) != layers_.end();
}

} // namespace slippy_map
