/**
 * @file pos_animation.cpp
 * @brief Eased pan animation implementation
 */

#include <slippy_map/core/pos_animation.h>
#include <slippy_map/constants.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace slippy_map {

double EaseOutQuad(double t) {
    const double clamped = std::max(0.0, std::min(1.0, t));
    return 1.0 - (1.0 - clamped) * (1.0 - clamped);
}

PosAnimation::PosAnimation(FrameScheduler& scheduler) : scheduler_(scheduler) {}

PosAnimation::~PosAnimation() {
    if (frame_) {
        scheduler_.CancelFrame(*frame_);
    }
}

void PosAnimation::Run(Pane& pane, const Point& new_pos, double duration) {
    Stop();

    pane_ = &pane;
    start_pos_ = pane.position;
    offset_ = new_pos.Subtract(start_pos_);
    start_time_ = scheduler_.Now();
    duration_ = std::chrono::duration<double>(std::max(0.0, duration));

    spdlog::debug("Pan animation from ({}, {}) to ({}, {}) over {}s",
                  start_pos_.x, start_pos_.y, new_pos.x, new_pos.y, duration_.count());

    Step(start_time_);
}

void PosAnimation::Stop() {
    if (frame_) {
        scheduler_.CancelFrame(*frame_);
        frame_.reset();
    }
}

void PosAnimation::Step(FrameTime now) {
    frame_.reset();

    const std::chrono::duration<double> elapsed = now - start_time_;
    if (elapsed < duration_) {
        const double t = elapsed.count() / duration_.count();
        pane_->position = start_pos_.Add(offset_.MultiplyBy(EaseOutQuad(t)));
        frame_ = scheduler_.RequestFrame([this](FrameTime frame_time) { Step(frame_time); });
    } else {
        pane_->position = start_pos_.Add(offset_);
        Fire(constants::events::END);
    }
}

} // namespace slippy_map
