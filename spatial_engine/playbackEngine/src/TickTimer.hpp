// TickTimer.hpp — Display-refresh tick while playing
//
// A cancellable periodic task. A background thread wakes at the tick rate and
// posts the tick onto the ControlQueue, so the handler always runs on the
// control context.
//
// ORDERING GUARANTEE:
//   Every posted tick carries the generation it was posted under. stop()
//   joins the thread and bumps the generation, so a tick that was already
//   queued when stop() returned sees a stale generation and does nothing.
//   The generation counter and the handler are shared with the posted tasks,
//   so a tick still sitting in the queue after the timer is destroyed is
//   harmless.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

#include "ControlQueue.hpp"

class TickTimer {
public:

    using Handler = std::function<void()>;

    explicit TickTimer(ControlQueue& control)
        : mControl(control),
          mGeneration(std::make_shared<std::atomic<uint64_t>>(0)) {}

    ~TickTimer() { stop(); }

    TickTimer(const TickTimer&) = delete;
    TickTimer& operator=(const TickTimer&) = delete;

    /// Start ticking at rateHz. Restarts if already running.
    void start(double rateHz, Handler onTick) {
        stop();
        if (!(rateHz > 0.0) || !onTick) return;

        const uint64_t generation = mGeneration->load();
        auto handler = std::make_shared<Handler>(std::move(onTick));
        const auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(1.0 / rateHz));

        {
            std::lock_guard<std::mutex> lock(mMutex);
            mStopRequested = false;
        }
        mRunning.store(true);

        mThread = std::thread([this, generation, handler, period]() {
            auto next = std::chrono::steady_clock::now() + period;
            std::unique_lock<std::mutex> lock(mMutex);
            while (!mStopRequested) {
                if (mWake.wait_until(lock, next, [this] { return mStopRequested; })) {
                    break;
                }
                next += period;

                std::weak_ptr<std::atomic<uint64_t>> weakGen = mGeneration;
                mControl.post([weakGen, generation, handler]() {
                    auto gen = weakGen.lock();
                    if (!gen || gen->load() != generation) return;
                    (*handler)();
                });
            }
        });
    }

    /// Stop ticking. No tick handler runs after this returns.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mStopRequested = true;
        }
        mWake.notify_all();
        if (mThread.joinable()) {
            mThread.join();
        }
        mGeneration->fetch_add(1);
        mRunning.store(false);
    }

    bool isRunning() const { return mRunning.load(); }

private:
    ControlQueue&                            mControl;
    std::shared_ptr<std::atomic<uint64_t>>   mGeneration;
    std::thread                              mThread;
    std::mutex                               mMutex;
    std::condition_variable                  mWake;
    bool                                     mStopRequested = false;
    std::atomic<bool>                        mRunning{false};
};
