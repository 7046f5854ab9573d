// SessionController.hpp — load → play → stop → reset orchestration
//
// Owns the PlaybackSession and the MotionMode selection. While playing, a
// TickTimer posts one tick per display refresh onto the control queue; each
// tick samples the PlaybackClock, maps progress (or elapsed seconds for
// time-driven modes) through the Trajectory model, pushes the position into
// the SpatialEngine and publishes a SessionSnapshot to subscribers.
//
// THREADING:
//   Every public method runs on the control context. Transcode completions
//   and tick callbacks arrive through ControlQueue::post(); both are guarded
//   (load generation, tick generation, lifetime token) so a late arrival can
//   never overwrite newer state or move the source after stop().

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ConfigLoader.hpp"
#include "ControlQueue.hpp"
#include "PlaybackClock.hpp"
#include "PlaybackTypes.hpp"
#include "SpatialEngine.hpp"
#include "TickTimer.hpp"
#include "Trajectory.hpp"
#include "Transcoder.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// PlaybackStatus
// ─────────────────────────────────────────────────────────────────────────────

enum class PlaybackStatus {
    Ready,          // prepared, nothing loaded
    Selecting,      // external file picker is open
    Transcoding,    // load in flight
    FileSelected,   // media loaded, not playing
    Playing,
    Stopped,        // media loaded, stopped or finished
    Error           // last operation failed; see errorMessage
};

const char* statusName(PlaybackStatus status);

// ─────────────────────────────────────────────────────────────────────────────
// PlaybackSession / SessionSnapshot
// ─────────────────────────────────────────────────────────────────────────────

struct PlaybackSession {
    bool             hasMedia = false;
    EngineReadyMedia media;
    double           durationSeconds = 0.0;
    float            progress = 0.0f;
    bool             isPlaying = false;
    MotionMode       mode = MotionMode::Manual;
    Position3D       position;
    Position3D       manualPosition;   // last pad position (Manual mode)
};

struct SessionSnapshot {
    PlaybackStatus status = PlaybackStatus::Ready;
    bool           isPlaying = false;
    float          progress = 0.0f;
    double         durationSeconds = 0.0;
    Position3D     position;
    MotionMode     mode = MotionMode::Manual;
    std::string    errorMessage;
};

// ─────────────────────────────────────────────────────────────────────────────
// SessionController
// ─────────────────────────────────────────────────────────────────────────────

class SessionController {
public:

    using Observer = std::function<void(const SessionSnapshot&)>;

    SessionController(const PlayerConfig& config, SpatialEngine& engine,
                      const Transcoder& transcoder, ControlQueue& control);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // ── Operations ───────────────────────────────────────────────────────

    /// Prepare the engine at the configured height. Status → Ready.
    EngineResult start();

    /// The external picker opened. Status → Selecting.
    void beginSelection();

    /// Start an async transcode + engine load. Any pending load is
    /// superseded. The outcome arrives as a published snapshot.
    void load(const std::string& path, ReadAccessProvider& access);

    EngineResult play();
    void stop();
    void reset();

    void setMode(MotionMode mode);

    /// Pad drag: clamp to ±rangeMeters on the height plane, switch to
    /// Manual mode, and start playback if it is not running.
    EngineResult moveSource(float x, float z);

    /// One display-refresh step. Normally driven by the tick timer.
    void tick();

    // ── Observers ────────────────────────────────────────────────────────

    int  subscribe(Observer observer);
    void unsubscribe(int token);

    // ── Queries ──────────────────────────────────────────────────────────

    SessionSnapshot        snapshot() const;
    const PlaybackSession& session() const { return mSession; }
    PlaybackStatus         status() const { return mStatus; }
    bool                   isLoadPending() const { return mPendingJob != nullptr; }
    uint64_t               loadGeneration() const { return mLoadGeneration; }
    bool                   isTicking() const { return mTicker.isRunning(); }
    const PlayerConfig&    config() const { return mConfig; }

private:

    void onTranscodeFinished(uint64_t generation, TranscodeResult result);
    void onPlaybackFinished();

    Position3D positionAt(float progress, std::optional<double> seconds) const;
    void applyPosition(const Position3D& position);

    void startTicking();
    void stopTicking();

    void fail(const EngineResult& result);
    void publish();

    void retirePendingJob();
    void reapRetiredJobs();
    void discardTempFile();

    PlayerConfig        mConfig;
    SpatialEngine&      mEngine;
    const Transcoder&   mTranscoder;
    ControlQueue&       mControl;
    PlaybackClock       mClock;
    TickTimer           mTicker;

    PlaybackSession     mSession;
    PlaybackStatus      mStatus = PlaybackStatus::Ready;
    std::string         mErrorMessage;

    uint64_t                                   mLoadGeneration = 0;
    std::unique_ptr<TranscodeJob>              mPendingJob;
    std::vector<std::unique_ptr<TranscodeJob>> mRetiredJobs;

    std::map<int, Observer> mObservers;
    int                     mNextObserver = 1;

    // Posted transcode completions hold a weak reference to this token.
    std::shared_ptr<SessionController*> mLifetime;
};
