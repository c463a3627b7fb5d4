#pragma once

/**
 * @file map_view.h
 * @brief Map view state and coordinate conversions
 *
 * MapView owns the center, zoom, pixel origin and pan pane of one map
 * instance, converts between geographic coordinates and container pixels,
 * and notifies dependents through "moveend".
 */

#include <slippy_map/constants.h>
#include <slippy_map/core/evented.h>
#include <slippy_map/core/pos_animation.h>
#include <slippy_map/coordinates/lat_lng.h>
#include <slippy_map/math/bounds.h>
#include <slippy_map/math/point.h>
#include <slippy_map/platform/frame_scheduler.h>
#include <slippy_map/platform/viewport_host.h>
#include <memory>
#include <optional>
#include <vector>

namespace slippy_map {

struct Configuration;
class Layer;

/**
 * @brief Options of PanBy / PanTo
 */
struct PanOptions {
    /** Animate the pane instead of jumping */
    bool animate = true;

    /** Animation duration in seconds; the map default when unset */
    std::optional<double> duration;
};

/**
 * @brief View state of a single map instance
 *
 * Invariant: pixel_origin == Project(center, zoom) - viewport_size / 2.
 * It is recomputed on every change of center, zoom or viewport size and
 * never set independently. Zoom is kept as given (possibly fractional);
 * consumers round it when they need a discrete tile grid.
 *
 * Panning only moves the pane: center, zoom and pixel origin keep the
 * values of the last SetView(). Add GetPanePosition() to the pixel origin
 * for pixel-exact conversions during a pan, or call SetView() once it
 * settles.
 *
 * Thread Safety: not thread-safe; all calls must come from the thread that
 * drives the frame scheduler.
 */
class MapView : public Evented {
public:
    /**
     * @brief Constructor
     *
     * Reads the viewport size from the host and applies the initial view.
     *
     * @param host Viewport host; must outlive the map
     * @param scheduler Frame source for pan animations; must outlive the map
     * @param center Initial center
     * @param zoom Initial zoom
     */
    MapView(ViewportHost& host, FrameScheduler& scheduler, const LatLng& center, double zoom);

    /**
     * @brief Construct from a configuration
     *
     * @throws std::invalid_argument if the configuration is invalid
     */
    MapView(const Configuration& config, ViewportHost& host, FrameScheduler& scheduler);

    /**
     * @brief Destructor - detaches all layers
     */
    ~MapView() override;

    // ========================================================================
    // View Control
    // ========================================================================

    /**
     * @brief Set center and zoom without animation
     *
     * Recomputes the pixel origin, stops any pan animation, resets the pane
     * to (0, 0), updates every layer and fires "moveend".
     *
     * @param center New center
     * @param zoom New zoom (not clamped, not rounded)
     */
    void SetView(const LatLng& center, double zoom);

    /**
     * @brief Change zoom around the current center
     */
    void SetZoom(double zoom);

    void ZoomIn(double delta = constants::view::DEFAULT_ZOOM_DELTA);
    void ZoomOut(double delta = constants::view::DEFAULT_ZOOM_DELTA);

    /**
     * @brief Shift the visible area by a pixel offset
     *
     * The pane moves by -offset, optionally animated with ease-out-quad.
     * Fires "moveend" once the pan has been started (or applied).
     *
     * @param offset Viewport shift in pixels
     * @param options Animation options
     */
    void PanBy(const Point& offset, const PanOptions& options = {});

    /**
     * @brief Pan so that a location moves to where the center is drawn
     */
    void PanTo(const LatLng& latlng, const PanOptions& options = {});

    /**
     * @brief Re-read the host size after it changed
     *
     * Recomputes the pixel origin for the current center and zoom, then
     * fires "resize" and "moveend". Does nothing if the size is unchanged.
     */
    void InvalidateSize();

    // ========================================================================
    // Projection and Coordinate Conversion
    // ========================================================================

    /**
     * @brief Project to pixel space at the current zoom
     */
    Point Project(const LatLng& latlng) const;

    /**
     * @brief Project to pixel space at an explicit zoom
     */
    Point Project(const LatLng& latlng, double zoom) const;

    LatLng Unproject(const Point& point) const;
    LatLng Unproject(const Point& point, double zoom) const;

    /**
     * @brief Geographic location to container pixel
     *
     * round(Project(latlng) - pixel_origin). Rounding is part of the
     * contract: sub-pixel placement is not meaningful for the host.
     */
    Point LatLngToContainerPoint(const LatLng& latlng) const;

    /**
     * @brief Container pixel to geographic location
     *
     * Unproject(point + pixel_origin). Round trips through
     * LatLngToContainerPoint() lose up to half a pixel.
     */
    LatLng ContainerPointToLatLng(const Point& point) const;

    /**
     * @brief Visible area in pixel space: [pixel_origin, pixel_origin + size]
     */
    Bounds GetPixelBounds() const;

    /**
     * @brief Scale factor between two zoom levels: Scale(to) / Scale(from)
     *
     * @param to_zoom Target zoom
     * @param from_zoom Source zoom (current zoom when omitted)
     */
    double GetZoomScale(double to_zoom) const;
    double GetZoomScale(double to_zoom, double from_zoom) const;

    /**
     * @brief Pixel origin the view would have at another center / zoom
     */
    Point GetPixelOriginFor(const LatLng& center, double zoom) const;

    // ========================================================================
    // Accessors
    // ========================================================================

    const LatLng& GetCenter() const { return center_; }
    double GetZoom() const { return zoom_; }
    Point GetSize() const { return viewport_size_; }
    Point GetPixelOrigin() const { return pixel_origin_; }
    Point GetPanePosition() const { return map_pane_.position; }
    bool IsPanning() const { return pan_animation_ && pan_animation_->IsRunning(); }
    double GetDefaultPanDuration() const { return default_pan_duration_; }

    // ========================================================================
    // Layer Management
    // ========================================================================

    /**
     * @brief Attach a layer and call Layer::OnAdd
     *
     * Adding a layer that is already attached does nothing.
     *
     * @throws std::invalid_argument if layer is null
     */
    void AddLayer(std::shared_ptr<Layer> layer);

    /**
     * @brief Detach a layer and call Layer::OnRemove
     */
    void RemoveLayer(const std::shared_ptr<Layer>& layer);

    bool HasLayer(const std::shared_ptr<Layer>& layer) const;

    std::size_t GetLayerCount() const { return layers_.size(); }

private:
    void ResetView();
    void UpdateLayers();

    ViewportHost& host_;
    FrameScheduler& scheduler_;

    LatLng center_;
    double zoom_ = 0.0;
    Point viewport_size_;
    Point pixel_origin_;

    Pane map_pane_;
    std::unique_ptr<PosAnimation> pan_animation_;
    double default_pan_duration_;

    std::vector<std::shared_ptr<Layer>> layers_;
};

} // namespace slippy_map
