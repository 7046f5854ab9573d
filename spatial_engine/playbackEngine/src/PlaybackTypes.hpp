// PlaybackTypes.hpp — Shared data types for the binaural playback engine
//
// These structs are used across the agents (Streaming, Spatializer, Backend,
// SpatialEngine, SessionController) to pass data through the pipeline.
//
// ─────────────────────────────────────────────────────────────────────────────
// THREADING MODEL
// ─────────────────────────────────────────────────────────────────────────────
//
// The engine uses FOUR kinds of thread:
//
//  ┌──────────────────┬────────────────────────────────────────────────────┐
//  │ Thread           │ Role                                               │
//  ├──────────────────┼────────────────────────────────────────────────────┤
//  │ CONTROL context  │ Owns SessionController + SpatialEngine. Every      │
//  │                  │ graph reconfiguration, tick and completion runs    │
//  │                  │ here (ControlQueue). Single-threaded by contract.  │
//  ├──────────────────┼────────────────────────────────────────────────────┤
//  │ AUDIO thread     │ AlloLib AudioIO callback. Runs                     │
//  │                  │ SpatialEngine::processBlock() every buffer.        │
//  │                  │ MUST NOT allocate, lock, or do I/O.                │
//  │                  │ Owns: EngineState frame counter writes.            │
//  ├──────────────────┼────────────────────────────────────────────────────┤
//  │ LOADER thread    │ Streaming::loaderWorker(). Refills the inactive    │
//  │                  │ double-buffer slot and detects end-of-stream,      │
//  │                  │ which it POSTS to the control context.             │
//  ├──────────────────┼────────────────────────────────────────────────────┤
//  │ WORKER threads   │ Transcoder jobs and the TickTimer. They never      │
//  │                  │ touch engine/session state, they only post.        │
//  └──────────────────┴────────────────────────────────────────────────────┘
//
// MEMORY ORDERING RULES:
//
//  ┌─────────────────────────────┬────────────────────────────────────────┐
//  │ Atomic                      │ Ordering used                          │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ EngineConfig::masterGain    │ relaxed (audio reads once per block,   │
//  │ ::sourceX/Y/Z               │ stale-by-one-block is inaudible)       │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ EngineConfig::scheduled     │ release on write (control thread arms  │
//  │                             │ after rewinding the stream); acquire   │
//  │                             │ on read (audio thread)                 │
//  ├─────────────────────────────┼────────────────────────────────────────┤
//  │ EngineState::frameCounter   │ relaxed (single writer: audio thread;  │
//  │ ::playbackTimeSec           │ readers poll for the playback clock)   │
//  │ ::hasRenderTimestamp        │                                        │
//  └─────────────────────────────┴────────────────────────────────────────┘
//
// INVARIANTS THAT MUST NEVER BE VIOLATED:
//
//  1. The control thread only rewinds or reopens the stream while
//     EngineConfig::scheduled is false. The audio thread never reads the
//     stream unless it observed scheduled == true at block start.
//
//  2. Streaming::close() is called only AFTER the output has been stopped
//     (no audio callback can be reading the double buffers).
//
//  3. End-of-stream is detected by the loader thread, never the audio thread,
//     and handed to the control context through ControlQueue::post().

#pragma once

#include <atomic>
#include <cmath>
#include <cstdint>
#include <string>

// ─────────────────────────────────────────────────────────────────────────────
// Position3D — source position in metres
// ─────────────────────────────────────────────────────────────────────────────
// Right-handed: x right, y up (height), -z in front of the listener.
// The listener sits at the origin.

struct Position3D {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

inline bool isFinite(const Position3D& p) {
    return std::isfinite(p.x) && std::isfinite(p.y) && std::isfinite(p.z);
}

// ─────────────────────────────────────────────────────────────────────────────
// MotionMode — named trajectories
// ─────────────────────────────────────────────────────────────────────────────

enum class MotionMode {
    Manual,          // Held at the last pad position, clamped to ±rangeMeters
    FrontBack,       // z: frontZ → backZ
    LeftRight,       // x: leftX → rightX
    BottomTop,       // y: bottomY → topY
    OverheadOrbit,   // one revolution over the whole file
    ParabolicRise,   // front→back sweep with a parabolic height rise
    ContinuousOrbit  // time-driven orbit, one revolution per orbitPeriodSec
};

const char* motionModeName(MotionMode mode);

/// Parse a mode name ("manual", "front_back", ...). Returns false if unknown.
bool parseMotionMode(const std::string& name, MotionMode& out);

/// True for modes driven by elapsed seconds instead of file progress.
inline bool isTimeDriven(MotionMode mode) {
    return mode == MotionMode::ContinuousOrbit;
}

// ─────────────────────────────────────────────────────────────────────────────
// TrajectoryBounds — per-mode geometry (static configuration)
// ─────────────────────────────────────────────────────────────────────────────

struct TrajectoryBounds {
    float frontZ         = -1.5f;  // front bound (negative z)
    float backZ          =  1.5f;  // back bound (positive z)
    float leftX          = -1.5f;
    float rightX         =  1.5f;
    float bottomY        =  0.0f;
    float topY           =  2.4f;
    float orbitRadius    =  1.5f;
    float orbitPeriodSec =  8.0f;  // ContinuousOrbit only
    float rangeMeters    =  1.5f;  // Manual clamp: |x|, |z| <= rangeMeters
};

// ─────────────────────────────────────────────────────────────────────────────
// EngineError / EngineResult — typed failures
// ─────────────────────────────────────────────────────────────────────────────

enum class EngineError {
    None = 0,
    NotPrepared,
    NoMediaLoaded,
    SourceUnreadable,
    TranscodeBackendUnavailable,
    TranscodeFailed,
    TranscodeCancelled,
    OutputSessionUnavailable,
    EngineStartFailed,
    MediaUnavailable,
    InvalidDuration,
    ScheduleFailed
};

const char* errorName(EngineError error);

struct EngineResult {
    EngineError error = EngineError::None;
    std::string detail;   // human-readable diagnostic (may be empty)

    bool ok() const { return error == EngineError::None; }

    static EngineResult success() { return EngineResult{}; }
    static EngineResult failure(EngineError e, std::string message = {}) {
        EngineResult r;
        r.error  = e;
        r.detail = std::move(message);
        return r;
    }
};

/// "TranscodeFailed: <detail>" style status string for observers.
std::string describe(const EngineResult& result);

// ─────────────────────────────────────────────────────────────────────────────
// EngineReadyMedia — a decoded, seekable PCM file the engine can stream
// ─────────────────────────────────────────────────────────────────────────────

struct EngineReadyMedia {
    std::string path;
    int         sampleRate = 0;
    int         channels   = 0;
    uint64_t    frames     = 0;

    double durationSeconds() const {
        return sampleRate > 0 ? static_cast<double>(frames) / sampleRate : 0.0;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// EngineConfig — engine settings + live controls
// ─────────────────────────────────────────────────────────────────────────────
// Plain fields are set before prepare()/load() and read-only afterwards.
// Live controls are atomics written by the control thread and read by the
// audio thread once per block.

struct EngineConfig {
    // ── Audio device settings ────────────────────────────────────────────
    int    bufferSize      = 512;    // Frames per audio callback buffer
    int    outputChannels  = 2;      // Binaural: left ear, right ear

    // ── Spatial renderer settings ────────────────────────────────────────
    float  spatialFocus    = 1.0f;   // DBAP rolloff exponent
    float  earRadius       = 1.0f;   // Virtual ear-pair distance from origin (m)

    // ── Streaming ────────────────────────────────────────────────────────
    uint64_t chunkFrames   = 48000 * 5;  // Double-buffer chunk size

    // ── Live controls ────────────────────────────────────────────────────
    std::atomic<float> masterGain{0.8f};
    std::atomic<float> sourceX{0.0f};
    std::atomic<float> sourceY{0.0f};
    std::atomic<float> sourceZ{0.0f};

    // True while a scheduled file playback is in flight.
    std::atomic<bool>  scheduled{false};
};

// ─────────────────────────────────────────────────────────────────────────────
// EngineState — runtime state published by the audio thread
// ─────────────────────────────────────────────────────────────────────────────

struct EngineState {
    // ── Render clock ─────────────────────────────────────────────────────
    std::atomic<uint64_t> frameCounter{0};       // Frames rendered since schedule
    std::atomic<double>   playbackTimeSec{0.0};  // frameCounter / media rate
    std::atomic<bool>     hasRenderTimestamp{false};  // false until first block

    // ── Performance monitoring ───────────────────────────────────────────
    std::atomic<float>    cpuLoad{0.0f};

    // ── Media info (set at load time) ────────────────────────────────────
    std::atomic<uint64_t> totalFrames{0};
    std::atomic<int>      mediaSampleRate{0};
    std::atomic<double>   mediaDuration{0.0};

    /// Rewind the render clock (control thread, while nothing is scheduled).
    void resetClock() {
        frameCounter.store(0, std::memory_order_relaxed);
        playbackTimeSec.store(0.0, std::memory_order_relaxed);
        hasRenderTimestamp.store(false, std::memory_order_relaxed);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// EnginePhase / EngineGraphState
// ─────────────────────────────────────────────────────────────────────────────

enum class EnginePhase {
    Unprepared,
    Prepared,
    Loaded,
    Playing,
    Stopped
};

const char* enginePhaseName(EnginePhase phase);

// Attachment/connection state of source → spatializer → output.
// Owned by SpatialEngine; only a copy is ever handed out.
struct EngineGraphState {
    bool sessionActive       = false;
    bool sourceAttached      = false;
    bool spatializerAttached = false;
    bool connected           = false;
    bool outputRunning       = false;
    int  connectedSampleRate = 0;
    int  connectedChannels   = 0;   // channels of the media feeding the source
};
