#pragma once

/**
 * @file pos_animation.h
 * @brief Frame-driven position animation of a pane
 */

#include <slippy_map/core/evented.h>
#include <slippy_map/math/point.h>
#include <slippy_map/platform/frame_scheduler.h>
#include <chrono>
#include <optional>

namespace slippy_map {

/**
 * @brief Transformable container whose offset encodes the in-flight pan
 *
 * Distinct from the map's logical pixel origin.
 */
struct Pane {
    Point position;  ///< Current rendered offset in pixels
};

/**
 * @brief Ease-out-quadratic curve: 1 - (1 - t)^2
 *
 * @param t Normalized time, clamped to [0, 1]
 */
double EaseOutQuad(double t);

/**
 * @brief Animates a pane's position towards a target
 *
 * At most one animation is active per instance. Run() while running stops
 * the previous animation and restarts from the pane's current rendered
 * position (last call wins, no queuing). Fires "end" when the target is
 * reached; a stopped animation never fires "end".
 */
class PosAnimation : public Evented {
public:
    /**
     * @brief Constructor
     *
     * @param scheduler Host frame source; must outlive the animation
     */
    explicit PosAnimation(FrameScheduler& scheduler);

    /**
     * @brief Destructor - cancels any pending frame
     */
    ~PosAnimation() override;

    /**
     * @brief Start animating a pane towards a position
     *
     * The first tick runs synchronously, so a zero duration moves the pane
     * immediately.
     *
     * @param pane Pane to move; must outlive the animation
     * @param new_pos Target position
     * @param duration Duration in seconds
     */
    void Run(Pane& pane, const Point& new_pos, double duration);

    /**
     * @brief Stop the animation where it is
     */
    void Stop();

    /**
     * @brief Check if an animation frame is pending
     */
    bool IsRunning() const { return frame_.has_value(); }

    /**
     * @brief Target of the current (or last) animation
     */
    Point GetTarget() const { return start_pos_.Add(offset_); }

private:
    void Step(FrameTime now);

    FrameScheduler& scheduler_;
    Pane* pane_ = nullptr;
    Point start_pos_;
    Point offset_;
    FrameTime start_time_;
    std::chrono::duration<double> duration_{0.0};
    std::optional<FrameHandle> frame_;
};

} // namespace slippy_map
