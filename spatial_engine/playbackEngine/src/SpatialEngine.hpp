// SpatialEngine.hpp — Owner of the binaural audio graph
//
// Wires the graph  Streaming (source) → Spatializer (ear-pair DBAP) →
// AudioOutput (sink)  and drives its lifecycle:
//
//   Unprepared ──prepare──▶ Prepared ──load──▶ Loaded ──play──▶ Playing
//                              ▲                  ▲               │  ▲
//                              └──── reset ───────┤      stop/EOF ▼  │ play
//                                                 └────────────── Stopped
//
// Every public method runs on the control context (ControlQueue owner).
// processBlock() runs on the audio thread; see PlaybackTypes.hpp for the
// threading model and the atomics it is allowed to touch.
//
// Natural end-of-file: the Streaming loader thread notices the render clock
// reaching the last frame of the armed schedule and posts it to the control
// queue. handleEndOfStream() then stops the output, rewinds the clock and
// fires the completion handler given to play(). Stale notifications (from a
// schedule that was stopped or replaced) are dropped by schedule id.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "ControlQueue.hpp"
#include "OutputBackend.hpp"
#include "PlaybackTypes.hpp"
#include "Spatializer.hpp"
#include "Streaming.hpp"

class SpatialEngine : public AudioRenderer {
public:

    using CompletionHandler = std::function<void()>;

    SpatialEngine(EngineConfig& config, EngineState& state,
                  AudioOutput& output, ControlQueue& control);
    ~SpatialEngine() override;

    SpatialEngine(const SpatialEngine&) = delete;
    SpatialEngine& operator=(const SpatialEngine&) = delete;

    // ── Lifecycle ────────────────────────────────────────────────────────

    /// Idempotent setup: output session, node attachment, listener at the
    /// origin, source at (0, heightY, 0). Stops playback first.
    EngineResult prepare(float heightY);

    /// Open the media and re-wire the graph at its native format.
    EngineResult load(const EngineReadyMedia& media);

    /// Schedule the whole file from its start. No-op while playing.
    /// onComplete runs on the control context after natural end-of-file.
    EngineResult play(CompletionHandler onComplete = {});

    /// Halt playback and the output; progress returns to 0. Any state.
    void stop();

    /// stop() and discard the loaded media.
    void reset();

    // ── Source position ──────────────────────────────────────────────────

    /// Horizontal move on the current height plane.
    void setPosition(float x, float z);
    void setPosition(const Position3D& position);

    // ── Queries ──────────────────────────────────────────────────────────

    bool             isPlaying() const { return mPhase == EnginePhase::Playing; }
    bool             hasMedia() const { return mHasMedia; }
    EnginePhase      phase() const { return mPhase; }
    double           durationSeconds() const;
    float            heightY() const { return mHeightY; }
    Position3D       position() const;
    EngineGraphState graphState() const;
    const EngineState& state() const { return mState; }
    const std::string& mediaPath() const { return mMediaPath; }

    // ── AudioRenderer (audio thread) ─────────────────────────────────────
    void processBlock(al::AudioIOData& io) override;

private:

    void handleEndOfStream(uint64_t scheduleId);
    void haltSchedule();
    void disconnect();

    EngineConfig&   mConfig;
    EngineState&    mState;
    AudioOutput&    mOutput;
    ControlQueue&   mControl;

    Streaming       mStreaming;
    Spatializer     mSpatializer;

    // ── Control-context state ────────────────────────────────────────────
    EnginePhase       mPhase = EnginePhase::Unprepared;
    EngineGraphState  mGraph;
    bool              mHasMedia = false;
    std::string       mMediaPath;
    float             mHeightY = 0.0f;

    uint64_t          mScheduleId = 0;      // id of the schedule in flight (0 = none)
    uint64_t          mNextScheduleId = 0;
    CompletionHandler mCompletion;

    // Posted end-of-stream tasks hold a weak reference to this token.
    std::shared_ptr<SpatialEngine*> mLifetime;
};
