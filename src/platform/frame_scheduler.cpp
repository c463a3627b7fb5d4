/**
 * @file frame_scheduler.cpp
 * @brief Manual frame scheduler implementation
 */

#include <slippy_map/platform/frame_scheduler.h>
#include <utility>

namespace slippy_map {

// ManualFrameScheduler implementation

ManualFrameScheduler::ManualFrameScheduler(FrameTime start) : now_(start) {}

FrameHandle ManualFrameScheduler::RequestFrame(FrameCallback callback) {
    const FrameHandle handle = next_handle_++;
    pending_.emplace(handle, std::move(callback));
    return handle;
}

void ManualFrameScheduler::CancelFrame(FrameHandle handle) {
    pending_.erase(handle);
    running_.erase(handle);
}

std::size_t ManualFrameScheduler::AdvanceBy(std::chrono::duration<double> delta) {
    now_ += std::chrono::duration_cast<FrameClock::duration>(delta);
    return RunFrame();
}

std::size_t ManualFrameScheduler::RunFrame() {
    // Callbacks requested while running belong to the next frame
    running_.clear();
    running_.swap(pending_);

    std::size_t invoked = 0;
    while (!running_.empty()) {
        auto it = running_.begin();
        FrameCallback callback = std::move(it->second);
        running_.erase(it);
        callback(now_);
        ++invoked;
    }
    return invoked;
}

} // namespace slippy_map
