// PlaybackClock.hpp — Playback position from the render clock
//
// Reads the frame counter the audio callback publishes in EngineState, so the
// reported time follows what was actually rendered (buffering and underruns
// included) instead of wall-clock time.
//
// THREADING:
//   Read-only view. Safe from any thread; the control context polls it from
//   SessionController::tick().

#pragma once

#include <algorithm>
#include <cmath>
#include <optional>

#include "PlaybackTypes.hpp"

/// progress = clamp(seconds / duration, 0, 1); 0 when duration <= 0.
inline double progressFor(double seconds, double durationSeconds) {
    if (!(durationSeconds > 0.0) || !std::isfinite(durationSeconds)) return 0.0;
    if (!std::isfinite(seconds)) return 0.0;
    return std::clamp(seconds / durationSeconds, 0.0, 1.0);
}

class PlaybackClock {
public:

    explicit PlaybackClock(const EngineState& state) : mState(state) {}

    /// Seconds rendered since the current playback was scheduled, or none if
    /// the pipeline has not rendered a block yet.
    std::optional<double> currentSeconds() const {
        if (!mState.hasRenderTimestamp.load(std::memory_order_relaxed)) {
            return std::nullopt;
        }
        return mState.playbackTimeSec.load(std::memory_order_relaxed);
    }

    /// Progress against the given duration. No timestamp yet → 0.
    double progress(double durationSeconds) const {
        const std::optional<double> seconds = currentSeconds();
        if (!seconds) return 0.0;
        return progressFor(*seconds, durationSeconds);
    }

private:
    const EngineState& mState;
};
