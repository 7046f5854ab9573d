// Trajectory.hpp — Source position from progress or elapsed time
//
// Maps a normalized progress value (or elapsed seconds for time-driven modes)
// to a Position3D for the selected MotionMode. Everything here is a pure
// function of its arguments: no state, no I/O, safe from any thread.
//
// RESPONSIBILITIES:
// 1. Clamp progress to [0, 1] before interpolating any bounded mode.
// 2. Interpolate the sweep modes so that progress 0 and 1 land exactly on
//    the configured bounds.
// 3. Derive a synthetic progress (elapsed mod period / period) for the
//    time-driven orbit.
// 4. Clamp manual pad positions to ±rangeMeters on the horizontal plane.
// 5. Sample ordered paths for visualization (parabola, orbit, sweeps).
//
// COORDINATES:
//   x right, y up, -z in front of the listener. The listener is at the origin
//   and the source normally rides the overhead plane y = heightY.

#pragma once

#include <algorithm>
#include <cmath>
#include <vector>

#include "PlaybackTypes.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// PadMapping — result of mapping a pad point to metres
// ─────────────────────────────────────────────────────────────────────────────

struct PadMapping {
    float xMeters  = 0.0f;   // clamped horizontal position (right positive)
    float zMeters  = 0.0f;   // clamped depth (down the pad = behind)
    float displayX = 0.0f;   // clamped point in pad coordinates
    float displayY = 0.0f;
};

// ─────────────────────────────────────────────────────────────────────────────
// Trajectory
// ─────────────────────────────────────────────────────────────────────────────

class Trajectory {
public:

    // ── Position for a progress value ────────────────────────────────────
    // manual is only read in MotionMode::Manual (last pad position).

    static Position3D positionFor(MotionMode mode, float progress, float heightY,
                                  const TrajectoryBounds& bounds,
                                  const Position3D& manual = Position3D{}) {
        const float p = clampProgress(progress);

        switch (mode) {
            case MotionMode::Manual:
                return clampManual(manual.x, manual.z, heightY, bounds.rangeMeters);

            case MotionMode::FrontBack:
                return Position3D{0.0f, heightY, lerp(bounds.frontZ, bounds.backZ, p)};

            case MotionMode::LeftRight:
                return Position3D{lerp(bounds.leftX, bounds.rightX, p), heightY, 0.0f};

            case MotionMode::BottomTop:
                return Position3D{0.0f, lerp(bounds.bottomY, bounds.topY, p), 0.0f};

            case MotionMode::OverheadOrbit:
            case MotionMode::ContinuousOrbit:
                return orbit(p, heightY, bounds.orbitRadius);

            case MotionMode::ParabolicRise: {
                // Horizontal sweep front → back while the height rises along
                // y = bottom + (top - bottom) * p².
                const float rise = p * p;
                return Position3D{0.0f,
                                  lerp(bounds.bottomY, bounds.topY, rise),
                                  lerp(bounds.frontZ, bounds.backZ, p)};
            }
        }
        return Position3D{0.0f, heightY, 0.0f};
    }

    // ── Position for elapsed seconds ─────────────────────────────────────
    // Continuous sweep with no discrete end: the mode's path repeats every
    // orbitPeriodSec (progress = elapsed mod period / period).

    static Position3D positionAtTime(MotionMode mode, double elapsedSec, float heightY,
                                     const TrajectoryBounds& bounds,
                                     const Position3D& manual = Position3D{}) {
        const float progress = progressFromElapsed(elapsedSec, bounds.orbitPeriodSec);
        return positionFor(mode, progress, heightY, bounds, manual);
    }

    // ── Helpers ──────────────────────────────────────────────────────────

    /// Clamp to [0, 1]. NaN maps to 0.
    static float clampProgress(float progress) {
        if (!std::isfinite(progress)) {
            return progress > 0.0f ? 1.0f : 0.0f;
        }
        return std::clamp(progress, 0.0f, 1.0f);
    }

    /// elapsed mod period / period, in [0, 1). Non-positive period → 0.
    static float progressFromElapsed(double elapsedSec, double periodSec) {
        if (!(periodSec > 0.0) || !std::isfinite(elapsedSec)) return 0.0f;
        double phase = std::fmod(elapsedSec, periodSec);
        if (phase < 0.0) phase += periodSec;
        return static_cast<float>(phase / periodSec);
    }

    /// Manual pad position on the plane y = heightY, clamped to ±range.
    static Position3D clampManual(float x, float z, float heightY, float rangeMeters) {
        const float r = std::abs(rangeMeters);
        const float cx = std::isfinite(x) ? std::clamp(x, -r, r) : 0.0f;
        const float cz = std::isfinite(z) ? std::clamp(z, -r, r) : 0.0f;
        return Position3D{cx, heightY, cz};
    }

    /// Map a pad point (pixels, origin top-left) to metres. The pad's radius
    /// is half its shorter side and maps to rangeMeters.
    static PadMapping padToPosition(float pointX, float pointY,
                                    float padWidth, float padHeight,
                                    float rangeMeters) {
        PadMapping m;
        const float radius  = std::min(padWidth, padHeight) / 2.0f;
        const float centerX = padWidth / 2.0f;
        const float centerY = padHeight / 2.0f;
        if (radius <= 0.0f) {
            m.displayX = centerX;
            m.displayY = centerY;
            return m;
        }

        const float dx = std::clamp(pointX - centerX, -radius, radius);
        const float dy = std::clamp(pointY - centerY, -radius, radius);
        const float metersPerPoint = rangeMeters / radius;

        m.xMeters  = dx * metersPerPoint;
        m.zMeters  = dy * metersPerPoint;
        m.displayX = centerX + dx;
        m.displayY = centerY + dy;
        return m;
    }

    /// Ordered path of `count` samples from progress 0 to 1 inclusive.
    /// Used by the presentation layer (parabola preview, orbit ring).
    static std::vector<Position3D> samplePath(MotionMode mode, int count, float heightY,
                                              const TrajectoryBounds& bounds,
                                              const Position3D& manual = Position3D{}) {
        std::vector<Position3D> path;
        if (count <= 0) return path;
        path.reserve(static_cast<size_t>(count));

        if (count == 1) {
            path.push_back(positionFor(mode, 0.0f, heightY, bounds, manual));
            return path;
        }
        for (int i = 0; i < count; ++i) {
            const float p = static_cast<float>(i) / static_cast<float>(count - 1);
            path.push_back(positionFor(mode, p, heightY, bounds, manual));
        }
        return path;
    }

private:

    // (1 - t)·a + t·b hits a and b exactly at t = 0 and t = 1.
    static float lerp(float a, float b, float t) {
        return (1.0f - t) * a + t * b;
    }

    static Position3D orbit(float p, float heightY, float radius) {
        const float angle = 2.0f * static_cast<float>(M_PI) * p;
        return Position3D{radius * std::cos(angle), heightY, radius * std::sin(angle)};
    }
};
