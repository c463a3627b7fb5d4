#pragma once

/**
 * @file frame_scheduler.h
 * @brief Host per-frame callback contract
 *
 * Animations never sleep or spawn threads. They ask the host for a
 * callback on the next frame and re-arm it every tick.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

namespace slippy_map {

using FrameClock = std::chrono::steady_clock;
using FrameTime = FrameClock::time_point;

/**
 * @brief Handle of a requested frame callback
 */
using FrameHandle = std::uint64_t;

/**
 * @brief Callback invoked with the frame timestamp
 */
using FrameCallback = std::function<void(FrameTime)>;

/**
 * @brief Source of per-frame callbacks (~60 Hz) and of the current time
 */
class FrameScheduler {
public:
    virtual ~FrameScheduler() = default;

    /**
     * @brief Current time as seen by animations
     */
    virtual FrameTime Now() const = 0;

    /**
     * @brief Request a one-shot callback on the next frame
     *
     * @param callback Invoked once with the frame timestamp
     * @return FrameHandle Handle for CancelFrame(), never 0
     */
    virtual FrameHandle RequestFrame(FrameCallback callback) = 0;

    /**
     * @brief Cancel a pending callback; unknown or fired handles are ignored
     */
    virtual void CancelFrame(FrameHandle handle) = 0;
};

/**
 * @brief Frame scheduler driven explicitly by the host
 *
 * Time only moves when the host calls AdvanceBy(), which then runs one
 * frame. Frames requested from inside a callback run on the following
 * frame, not the current one.
 */
class ManualFrameScheduler : public FrameScheduler {
public:
    /**
     * @brief Constructor
     *
     * @param start Initial clock value
     */
    explicit ManualFrameScheduler(FrameTime start = FrameTime{});

    FrameTime Now() const override { return now_; }
    FrameHandle RequestFrame(FrameCallback callback) override;
    void CancelFrame(FrameHandle handle) override;

    /**
     * @brief Move the clock forward and run one frame
     *
     * @param delta Time to advance
     * @return std::size_t Number of callbacks invoked
     */
    std::size_t AdvanceBy(std::chrono::duration<double> delta);

    /**
     * @brief Run one frame without moving the clock
     *
     * @return std::size_t Number of callbacks invoked
     */
    std::size_t RunFrame();

    /**
     * @brief Number of callbacks waiting for the next frame
     */
    std::size_t GetPendingCount() const { return pending_.size(); }

private:
    FrameTime now_;
    FrameHandle next_handle_ = 1;
    std::map<FrameHandle, FrameCallback> pending_;
    std::map<FrameHandle, FrameCallback> running_;
};

} // namespace slippy_map
