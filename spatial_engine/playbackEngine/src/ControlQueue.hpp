// ControlQueue.hpp — The single control context
//
// All engine and session mutation runs on the thread that drains this queue.
// Worker threads (transcoder jobs, tick timer, streaming loader) never touch
// that state directly: they post() a task and the owner thread runs it.
//
// The audio thread must NOT post (post() locks). It publishes through
// atomics; the loader thread turns those into posted tasks.

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

class ControlQueue {
public:

    using Task = std::function<void()>;

    ControlQueue() = default;
    ControlQueue(const ControlQueue&) = delete;
    ControlQueue& operator=(const ControlQueue&) = delete;

    /// Enqueue a task. Safe from any non-audio thread.
    void post(Task task) {
        {
            std::lock_guard<std::mutex> lock(mMutex);
            mTasks.push_back(std::move(task));
        }
        mCondition.notify_one();
    }

    /// Run every task queued at the time of the call. Tasks posted while
    /// draining wait for the next call. Returns the number of tasks run.
    size_t processPending() {
        std::deque<Task> batch;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            batch.swap(mTasks);
        }
        for (auto& task : batch) {
            if (task) task();
        }
        return batch.size();
    }

    /// Block up to `timeout` for work, then drain. Returns tasks run.
    size_t waitAndProcess(std::chrono::milliseconds timeout) {
        {
            std::unique_lock<std::mutex> lock(mMutex);
            mCondition.wait_for(lock, timeout, [this] { return !mTasks.empty(); });
        }
        return processPending();
    }

    /// Drain repeatedly until `done()` holds or the timeout expires.
    template <typename Predicate>
    bool runUntil(Predicate done, std::chrono::milliseconds timeout) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        processPending();
        while (!done()) {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) return false;
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            waitAndProcess(std::min(left, std::chrono::milliseconds(10)));
        }
        return true;
    }

    /// Keep draining for the whole duration.
    void runFor(std::chrono::milliseconds duration) {
        runUntil([] { return false; }, duration);
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mTasks.size();
    }

private:
    mutable std::mutex      mMutex;
    std::condition_variable mCondition;
    std::deque<Task>        mTasks;
};
