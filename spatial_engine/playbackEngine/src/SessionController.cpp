#include "SessionController.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

const char* statusName(PlaybackStatus status) {
    switch (status) {
        case PlaybackStatus::Ready:        return "Ready";
        case PlaybackStatus::Selecting:    return "Selecting";
        case PlaybackStatus::Transcoding:  return "Transcoding";
        case PlaybackStatus::FileSelected: return "FileSelected";
        case PlaybackStatus::Playing:      return "Playing";
        case PlaybackStatus::Stopped:      return "Stopped";
        case PlaybackStatus::Error:        return "Error";
    }
    return "Unknown";
}

SessionController::SessionController(const PlayerConfig& config, SpatialEngine& engine,
                                     const Transcoder& transcoder, ControlQueue& control)
    : mConfig(config),
      mEngine(engine),
      mTranscoder(transcoder),
      mControl(control),
      mClock(engine.state()),
      mTicker(control),
      mLifetime(std::make_shared<SessionController*>(this))
{
    mSession.mode = mConfig.mode;
    mSession.position = Position3D{0.0f, mConfig.heightY, 0.0f};
    mSession.manualPosition = mSession.position;
}

SessionController::~SessionController() {
    mLifetime.reset();
    stopTicking();

    if (mPendingJob) mPendingJob->cancel();
    for (auto& job : mRetiredJobs) job->cancel();
    mPendingJob.reset();     // joins
    mRetiredJobs.clear();

    mEngine.reset();
    discardTempFile();
}

// ─────────────────────────────────────────────────────────────────────────────
// start / beginSelection
// ─────────────────────────────────────────────────────────────────────────────

EngineResult SessionController::start() {
    // prepare() halts the engine; the session has to follow it.
    if (mSession.isPlaying || mTicker.isRunning()) {
        stop();
    }

    EngineResult r = mEngine.prepare(mConfig.heightY);
    if (!r.ok()) {
        fail(r);
        return r;
    }
    mSession.position = mEngine.position();
    if (!mSession.hasMedia) {
        mStatus = PlaybackStatus::Ready;
        mErrorMessage.clear();
    }
    std::cout << "[Session] Ready (mode " << motionModeName(mSession.mode) << ")." << std::endl;
    publish();
    return r;
}

void SessionController::beginSelection() {
    mStatus = PlaybackStatus::Selecting;
    mErrorMessage.clear();
    publish();
}

// ─────────────────────────────────────────────────────────────────────────────
// load
// ─────────────────────────────────────────────────────────────────────────────

void SessionController::load(const std::string& path, ReadAccessProvider& access) {
    const uint64_t generation = ++mLoadGeneration;

    retirePendingJob();
    reapRetiredJobs();
    stop();

    mStatus = PlaybackStatus::Transcoding;
    mErrorMessage.clear();
    std::cout << "[Session] Loading " << path << " (request " << generation << ")..." << std::endl;
    publish();

    std::weak_ptr<SessionController*> weak = mLifetime;
    ControlQueue* queue = &mControl;

    mPendingJob = mTranscoder.transcodeAsync(
        path, ScopedReadAccess(access, path),
        [weak, queue, generation](TranscodeResult result) {
            queue->post([weak, generation, result]() {
                if (auto alive = weak.lock()) {
                    (*alive)->onTranscodeFinished(generation, result);
                } else if (result.ok()) {
                    std::error_code ec;
                    fs::remove(result.media.path, ec);
                }
            });
        });
}

void SessionController::onTranscodeFinished(uint64_t generation, TranscodeResult result) {
    if (generation != mLoadGeneration) {
        // Superseded by a newer load or a reset; never apply it.
        std::cout << "[Session] Dropping stale load result (request " << generation
                  << ", current " << mLoadGeneration << ")." << std::endl;
        if (result.ok()) {
            std::error_code ec;
            fs::remove(result.media.path, ec);
        }
        return;
    }

    retirePendingJob();
    stopTicking();

    if (!result.ok()) {
        mEngine.reset();
        discardTempFile();
        mSession.hasMedia = false;
        mSession.media = EngineReadyMedia{};
        mSession.durationSeconds = 0.0;
        fail(result.result);
        return;
    }

    EngineResult r = mEngine.load(result.media);
    if (!r.ok()) {
        std::error_code ec;
        fs::remove(result.media.path, ec);
        discardTempFile();
        mSession.hasMedia = false;
        mSession.media = EngineReadyMedia{};
        mSession.durationSeconds = 0.0;
        fail(r);
        return;
    }

    if (mSession.hasMedia && mSession.media.path != result.media.path) {
        discardTempFile();
    }

    mSession.hasMedia        = true;
    mSession.media           = result.media;
    mSession.durationSeconds = mEngine.durationSeconds();
    mSession.progress        = 0.0f;
    mSession.isPlaying       = false;
    applyPosition(positionAt(0.0f, std::nullopt));

    mStatus = PlaybackStatus::FileSelected;
    mErrorMessage.clear();
    std::cout << "[Session] File selected (" << mSession.durationSeconds << " s)." << std::endl;
    publish();
}

// ─────────────────────────────────────────────────────────────────────────────
// play / stop / reset
// ─────────────────────────────────────────────────────────────────────────────

EngineResult SessionController::play() {
    if (!mSession.hasMedia) {
        EngineResult r = EngineResult::failure(EngineError::NoMediaLoaded, "select a file first");
        std::cerr << "[Session] WARNING: " << describe(r) << std::endl;
        return r;
    }
    if (mPendingJob) {
        EngineResult r = EngineResult::failure(EngineError::NoMediaLoaded, "file still loading");
        std::cerr << "[Session] WARNING: " << describe(r) << std::endl;
        return r;
    }
    if (mEngine.isPlaying()) {
        return EngineResult::success();
    }

    std::weak_ptr<SessionController*> weak = mLifetime;
    EngineResult r = mEngine.play([weak]() {
        if (auto alive = weak.lock()) {
            (*alive)->onPlaybackFinished();
        }
    });
    if (!r.ok()) {
        fail(r);
        return r;
    }

    mSession.isPlaying = true;
    mSession.progress = 0.0f;
    applyPosition(positionAt(0.0f, 0.0));
    mStatus = PlaybackStatus::Playing;
    mErrorMessage.clear();

    startTicking();
    publish();
    return r;
}

void SessionController::stop() {
    stopTicking();
    mEngine.stop();

    const bool wasPlaying = mSession.isPlaying;
    mSession.isPlaying = false;
    mSession.progress = 0.0f;

    if (mSession.hasMedia && (wasPlaying || mStatus == PlaybackStatus::Playing)) {
        mStatus = PlaybackStatus::Stopped;
    }
    publish();
}

void SessionController::reset() {
    ++mLoadGeneration;          // any pending completion is now stale
    retirePendingJob();
    reapRetiredJobs();

    stopTicking();
    mEngine.reset();
    discardTempFile();

    const MotionMode mode = mSession.mode;
    mSession = PlaybackSession{};
    mSession.mode = mode;
    mSession.position = mEngine.position();
    mSession.manualPosition = Position3D{0.0f, mConfig.heightY, 0.0f};

    mStatus = PlaybackStatus::Ready;
    mErrorMessage.clear();
    std::cout << "[Session] Reset." << std::endl;
    publish();
}

void SessionController::onPlaybackFinished() {
    stopTicking();
    mSession.isPlaying = false;
    mSession.progress = 0.0f;
    mStatus = PlaybackStatus::Stopped;
    std::cout << "[Session] Playback finished." << std::endl;
    publish();
}

// ─────────────────────────────────────────────────────────────────────────────
// Mode / manual position
// ─────────────────────────────────────────────────────────────────────────────

void SessionController::setMode(MotionMode mode) {
    mSession.mode = mode;
    if (mSession.hasMedia) {
        applyPosition(positionAt(mSession.progress, mClock.currentSeconds()));
    }
    std::cout << "[Session] Mode: " << motionModeName(mode) << std::endl;
    publish();
}

EngineResult SessionController::moveSource(float x, float z) {
    if (!mSession.hasMedia || mStatus == PlaybackStatus::Transcoding) {
        return EngineResult::failure(EngineError::NoMediaLoaded, "no file to move");
    }

    mSession.manualPosition = Trajectory::clampManual(x, z, mConfig.heightY,
                                                      mConfig.bounds.rangeMeters);
    mSession.mode = MotionMode::Manual;
    applyPosition(mSession.manualPosition);

    if (!mEngine.isPlaying()) {
        return play();
    }
    publish();
    return EngineResult::success();
}

// ─────────────────────────────────────────────────────────────────────────────
// tick
// ─────────────────────────────────────────────────────────────────────────────

void SessionController::tick() {
    if (!mSession.isPlaying || !mEngine.isPlaying()) {
        return;
    }

    const std::optional<double> seconds = mClock.currentSeconds();
    mSession.progress = static_cast<float>(mClock.progress(mSession.durationSeconds));
    applyPosition(positionAt(mSession.progress, seconds));
    publish();
}

Position3D SessionController::positionAt(float progress, std::optional<double> seconds) const {
    if (isTimeDriven(mSession.mode)) {
        return Trajectory::positionAtTime(mSession.mode, seconds.value_or(0.0),
                                          mConfig.heightY, mConfig.bounds,
                                          mSession.manualPosition);
    }
    return Trajectory::positionFor(mSession.mode, progress, mConfig.heightY,
                                   mConfig.bounds, mSession.manualPosition);
}

void SessionController::applyPosition(const Position3D& position) {
    mEngine.setPosition(position);
    mSession.position = position;
}

// ─────────────────────────────────────────────────────────────────────────────
// Ticking
// ─────────────────────────────────────────────────────────────────────────────

void SessionController::startTicking() {
    mTicker.start(mConfig.tickRateHz, [this]() { tick(); });
}

void SessionController::stopTicking() {
    mTicker.stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Observers
// ─────────────────────────────────────────────────────────────────────────────

int SessionController::subscribe(Observer observer) {
    const int token = mNextObserver++;
    mObservers[token] = std::move(observer);
    return token;
}

void SessionController::unsubscribe(int token) {
    mObservers.erase(token);
}

SessionSnapshot SessionController::snapshot() const {
    SessionSnapshot s;
    s.status          = mStatus;
    s.isPlaying       = mSession.isPlaying;
    s.progress        = mSession.progress;
    s.durationSeconds = mSession.durationSeconds;
    s.position        = mSession.position;
    s.mode            = mSession.mode;
    s.errorMessage    = mErrorMessage;
    return s;
}

void SessionController::publish() {
    const SessionSnapshot s = snapshot();
    // Observers may unsubscribe from inside the callback.
    const std::map<int, Observer> observers = mObservers;
    for (const auto& entry : observers) {
        if (entry.second) entry.second(s);
    }
}

void SessionController::fail(const EngineResult& result) {
    stopTicking();
    mSession.isPlaying = mEngine.isPlaying();
    mStatus = PlaybackStatus::Error;
    mErrorMessage = describe(result);
    std::cerr << "[Session] ERROR: " << mErrorMessage << std::endl;
    publish();
}

// ─────────────────────────────────────────────────────────────────────────────
// Jobs / temp files
// ─────────────────────────────────────────────────────────────────────────────

void SessionController::retirePendingJob() {
    if (!mPendingJob) return;
    mPendingJob->cancel();
    mRetiredJobs.push_back(std::move(mPendingJob));
}

void SessionController::reapRetiredJobs() {
    mRetiredJobs.erase(
        std::remove_if(mRetiredJobs.begin(), mRetiredJobs.end(),
                       [](const std::unique_ptr<TranscodeJob>& job) { return job->isDone(); }),
        mRetiredJobs.end());
}

void SessionController::discardTempFile() {
    if (!mSession.hasMedia || mSession.media.path.empty()) return;
    std::error_code ec;
    if (fs::remove(mSession.media.path, ec)) {
        std::cout << "[Session] Removed " << mSession.media.path << std::endl;
    }
}
