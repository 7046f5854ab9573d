#include "SpatialEngine.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>

SpatialEngine::SpatialEngine(EngineConfig& config, EngineState& state,
                             AudioOutput& output, ControlQueue& control)
    : mConfig(config),
      mState(state),
      mOutput(output),
      mControl(control),
      mStreaming(state),
      mLifetime(std::make_shared<SpatialEngine*>(this))
{
    // The loader thread calls this; hop onto the control context.
    std::weak_ptr<SpatialEngine*> weak = mLifetime;
    ControlQueue* queue = &mControl;
    mStreaming.setEndOfStreamHandler([weak, queue](uint64_t scheduleId) {
        queue->post([weak, scheduleId]() {
            if (auto alive = weak.lock()) {
                (*alive)->handleEndOfStream(scheduleId);
            }
        });
    });
}

SpatialEngine::~SpatialEngine() {
    mLifetime.reset();
    mConfig.scheduled.store(false, std::memory_order_release);
    mOutput.close();
    mStreaming.close();
}

// ─────────────────────────────────────────────────────────────────────────────
// prepare
// ─────────────────────────────────────────────────────────────────────────────

EngineResult SpatialEngine::prepare(float heightY) {
    stop();

    if (!mOutput.activateSession()) {
        return EngineResult::failure(EngineError::OutputSessionUnavailable,
                                     "no usable audio output device");
    }
    mGraph.sessionActive = true;

    if (!mGraph.sourceAttached) {
        mGraph.sourceAttached = true;
        std::cout << "[Engine] Source node attached." << std::endl;
    }
    if (!mGraph.spatializerAttached) {
        mGraph.spatializerAttached = true;
        std::cout << "[Engine] Spatializer attached (listener at origin)." << std::endl;
    }

    mHeightY = std::isfinite(heightY) ? heightY : 0.0f;
    setPosition(Position3D{0.0f, mHeightY, 0.0f});

    if (mPhase == EnginePhase::Unprepared) {
        mPhase = EnginePhase::Prepared;
    }
    std::cout << "[Engine] Prepared (height " << mHeightY << " m, phase "
              << enginePhaseName(mPhase) << ")." << std::endl;
    return EngineResult::success();
}

// ─────────────────────────────────────────────────────────────────────────────
// load
// ─────────────────────────────────────────────────────────────────────────────

EngineResult SpatialEngine::load(const EngineReadyMedia& media) {
    if (mPhase == EnginePhase::Unprepared) {
        return EngineResult::failure(EngineError::NotPrepared, "load before prepare");
    }

    stop();
    const Position3D keep = position();

    // Tear down the old wiring before the stream is replaced.
    disconnect();
    mStreaming.close();
    mHasMedia = false;
    mMediaPath.clear();
    mState.totalFrames.store(0, std::memory_order_relaxed);
    mState.mediaSampleRate.store(0, std::memory_order_relaxed);
    mState.mediaDuration.store(0.0, std::memory_order_relaxed);
    mPhase = EnginePhase::Prepared;

    if (!mStreaming.open(media.path, mConfig.chunkFrames)) {
        return EngineResult::failure(EngineError::MediaUnavailable,
                                     "cannot open " + media.path);
    }

    const uint64_t frames = mStreaming.totalFrames();
    const int sampleRate  = mStreaming.sampleRate();
    if (frames == 0 || sampleRate <= 0) {
        mStreaming.close();
        return EngineResult::failure(EngineError::InvalidDuration,
                                     media.path + " has no playable frames");
    }

    // Re-wire source → spatializer → output at the media's native rate.
    OutputSettings settings;
    settings.sampleRate     = sampleRate;
    settings.bufferSize     = mConfig.bufferSize;
    settings.outputChannels = mConfig.outputChannels;

    if (!mOutput.open(settings, this)) {
        mStreaming.close();
        return EngineResult::failure(EngineError::EngineStartFailed,
                                     "cannot open output at " + std::to_string(sampleRate) + " Hz");
    }

    const int capacity = std::max(mConfig.bufferSize, mOutput.framesPerBuffer());
    if (!mSpatializer.init(sampleRate, capacity, mConfig.spatialFocus, mConfig.earRadius)) {
        mOutput.close();
        mStreaming.close();
        return EngineResult::failure(EngineError::EngineStartFailed,
                                     "spatializer rejected the media format");
    }

    mGraph.connected           = true;
    mGraph.connectedSampleRate = sampleRate;
    mGraph.connectedChannels   = mStreaming.channels();

    mState.totalFrames.store(frames, std::memory_order_relaxed);
    mState.mediaSampleRate.store(sampleRate, std::memory_order_relaxed);
    mState.mediaDuration.store(static_cast<double>(frames) / sampleRate,
                               std::memory_order_relaxed);
    mState.resetClock();

    setPosition(keep);

    if (!mStreaming.rewind()) {
        disconnect();
        mStreaming.close();
        return EngineResult::failure(EngineError::MediaUnavailable,
                                     "cannot read " + media.path);
    }
    mStreaming.startLoader();

    if (!mOutput.start()) {
        disconnect();
        mStreaming.close();
        return EngineResult::failure(EngineError::EngineStartFailed,
                                     "audio output did not start");
    }
    mGraph.outputRunning = true;

    mHasMedia  = true;
    mMediaPath = media.path;
    mPhase     = EnginePhase::Loaded;

    std::cout << "[Engine] Loaded " << media.path << " ("
              << durationSeconds() << " s, " << mGraph.connectedChannels
              << " ch @ " << sampleRate << " Hz)." << std::endl;
    return EngineResult::success();
}

// ─────────────────────────────────────────────────────────────────────────────
// play / stop / reset
// ─────────────────────────────────────────────────────────────────────────────

EngineResult SpatialEngine::play(CompletionHandler onComplete) {
    if (mPhase == EnginePhase::Unprepared) {
        return EngineResult::failure(EngineError::NotPrepared, "play before prepare");
    }
    if (!mHasMedia) {
        return EngineResult::failure(EngineError::NoMediaLoaded, "nothing to play");
    }
    if (mPhase == EnginePhase::Playing) {
        return EngineResult::success();
    }

    // The stream is only touched here while nothing is scheduled.
    mState.resetClock();
    if (!mStreaming.rewind()) {
        return EngineResult::failure(EngineError::ScheduleFailed,
                                     "cannot rewind " + mMediaPath);
    }

    if (!mOutput.isRunning()) {
        if (!mOutput.start()) {
            return EngineResult::failure(EngineError::EngineStartFailed,
                                         "audio output did not restart");
        }
    }
    mGraph.outputRunning = true;

    mScheduleId = ++mNextScheduleId;
    mCompletion = std::move(onComplete);
    mStreaming.armEndOfStream(mScheduleId);
    mConfig.scheduled.store(true, std::memory_order_release);
    mPhase = EnginePhase::Playing;

    std::cout << "[Engine] Playing (schedule " << mScheduleId << ")." << std::endl;
    return EngineResult::success();
}

void SpatialEngine::stop() {
    haltSchedule();
    mOutput.stop();
    mGraph.outputRunning = false;
    mState.resetClock();
    if (mPhase == EnginePhase::Playing) {
        mPhase = EnginePhase::Stopped;
        std::cout << "[Engine] Stopped." << std::endl;
    }
}

void SpatialEngine::reset() {
    stop();
    disconnect();
    mStreaming.close();

    mHasMedia = false;
    mMediaPath.clear();
    mState.totalFrames.store(0, std::memory_order_relaxed);
    mState.mediaSampleRate.store(0, std::memory_order_relaxed);
    mState.mediaDuration.store(0.0, std::memory_order_relaxed);

    if (mPhase != EnginePhase::Unprepared) {
        mPhase = EnginePhase::Prepared;
    }
    std::cout << "[Engine] Reset." << std::endl;
}

// ─────────────────────────────────────────────────────────────────────────────
// Position
// ─────────────────────────────────────────────────────────────────────────────

void SpatialEngine::setPosition(float x, float z) {
    setPosition(Position3D{x, mHeightY, z});
}

void SpatialEngine::setPosition(const Position3D& position) {
    if (!isFinite(position)) {
        std::cerr << "[Engine] WARNING: Ignoring non-finite source position." << std::endl;
        return;
    }
    mConfig.sourceX.store(position.x, std::memory_order_relaxed);
    mConfig.sourceY.store(position.y, std::memory_order_relaxed);
    mConfig.sourceZ.store(position.z, std::memory_order_relaxed);
}

Position3D SpatialEngine::position() const {
    return Position3D{mConfig.sourceX.load(std::memory_order_relaxed),
                      mConfig.sourceY.load(std::memory_order_relaxed),
                      mConfig.sourceZ.load(std::memory_order_relaxed)};
}

double SpatialEngine::durationSeconds() const {
    if (!mHasMedia) return 0.0;
    return mState.mediaDuration.load(std::memory_order_relaxed);
}

EngineGraphState SpatialEngine::graphState() const {
    EngineGraphState g = mGraph;
    g.outputRunning = mOutput.isRunning();
    return g;
}

// ─────────────────────────────────────────────────────────────────────────────
// Private helpers
// ─────────────────────────────────────────────────────────────────────────────

void SpatialEngine::haltSchedule() {
    mConfig.scheduled.store(false, std::memory_order_release);
    mStreaming.disarmEndOfStream();
    mScheduleId = 0;
    mCompletion = nullptr;
}

void SpatialEngine::disconnect() {
    mOutput.close();
    mGraph.connected           = false;
    mGraph.outputRunning       = false;
    mGraph.connectedSampleRate = 0;
    mGraph.connectedChannels   = 0;
}

void SpatialEngine::handleEndOfStream(uint64_t scheduleId) {
    if (mPhase != EnginePhase::Playing || scheduleId != mScheduleId) {
        return;  // stopped or re-scheduled since the loader saw the end
    }

    CompletionHandler done = std::move(mCompletion);
    haltSchedule();
    mOutput.stop();
    mGraph.outputRunning = false;
    mState.resetClock();
    mPhase = EnginePhase::Stopped;

    std::cout << "[Engine] End of file (schedule " << scheduleId << ")." << std::endl;
    if (done) done();
}

// ─────────────────────────────────────────────────────────────────────────────
// Audio thread
// ─────────────────────────────────────────────────────────────────────────────
// Output is silence unless a schedule is armed. Never allocates or locks.

void SpatialEngine::processBlock(al::AudioIOData& io) {
    const unsigned int numFrames   = static_cast<unsigned int>(io.framesPerBuffer());
    const unsigned int numChannels = static_cast<unsigned int>(io.channelsOut());

    for (unsigned int ch = 0; ch < numChannels; ++ch) {
        std::memset(io.outBuffer(ch), 0, numFrames * sizeof(float));
    }

    if (!mConfig.scheduled.load(std::memory_order_acquire)) {
        return;
    }

    const uint64_t total   = mState.totalFrames.load(std::memory_order_relaxed);
    const uint64_t current = mState.frameCounter.load(std::memory_order_relaxed);
    if (current >= total) {
        return;  // waiting for the loader to report end-of-file
    }

    // Snapshot live controls once per block.
    const al::Vec3f pos(mConfig.sourceX.load(std::memory_order_relaxed),
                        mConfig.sourceY.load(std::memory_order_relaxed),
                        mConfig.sourceZ.load(std::memory_order_relaxed));
    const float gain = mConfig.masterGain.load(std::memory_order_relaxed);

    const unsigned int toRender = static_cast<unsigned int>(
        std::min<uint64_t>(numFrames, total - current));
    const unsigned int rendered = mSpatializer.renderBlock(io, mStreaming, pos, gain,
                                                           current, toRender);

    const uint64_t newFrames = current + rendered;
    const int sampleRate = mState.mediaSampleRate.load(std::memory_order_relaxed);
    mState.frameCounter.store(newFrames, std::memory_order_relaxed);
    if (sampleRate > 0) {
        mState.playbackTimeSec.store(static_cast<double>(newFrames) / sampleRate,
                                     std::memory_order_relaxed);
    }
    mState.hasRenderTimestamp.store(true, std::memory_order_relaxed);

    mState.cpuLoad.store(
        std::max(0.0f, std::min(1.0f, static_cast<float>(mOutput.cpuLoad()))),
        std::memory_order_relaxed);
}
