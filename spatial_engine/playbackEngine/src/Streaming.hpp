// Streaming.hpp — Agent 1: Media Streaming from Disk
//
// Streams the engine-ready media file from disk in real time using
// double-buffered I/O. The source has two pre-allocated mono buffers that
// alternate: one is read by the audio thread while the other is filled by a
// background loader thread. Multichannel media is downmixed to mono while a
// chunk is loaded, so the audio thread only ever sees one channel.
//
// RESPONSIBILITIES:
// 1. Open the media file and pre-allocate the double buffers.
// 2. Rewind: load the first chunk synchronously before each playback.
// 3. Run a background thread that reads ahead into the inactive buffer.
// 4. Provide a lock-free getBlock() for the audio callback.
// 5. Detect end-of-stream for the armed schedule and hand it to the
//    registered handler (the engine posts it to the control context).
//
// REAL-TIME SAFETY:
// - The audio callback (getBlock) NEVER does file I/O, locks, or allocates.
// - The loader thread and the control thread (rewind/open) are the only
//   threads that touch libsndfile; fileMutex serializes them.
// - mScanMutex keeps rewind() from racing a loader scan that is switching
//   buffer states.

#pragma once

#include <atomic>
#include <chrono>
#include <cstring>    // memset, memcpy
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <sndfile.h>

#include "PlaybackTypes.hpp"
#include "WavUtils.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// Constants
// ─────────────────────────────────────────────────────────────────────────────

// When playback reaches this fraction of the current chunk, trigger preload
// of the next chunk into the inactive buffer.
static constexpr float kPreloadThreshold = 0.5f;

// Loader poll period. Well under one audio buffer at typical settings.
static constexpr auto kLoaderPollInterval = std::chrono::milliseconds(2);

// ─────────────────────────────────────────────────────────────────────────────
// StreamBufferState — State machine for each double buffer slot
// ─────────────────────────────────────────────────────────────────────────────
// Transitions:
//   EMPTY → LOADING (loader thread starts filling)
//   LOADING → READY (loader thread finished filling)
//   READY → PLAYING (audio thread switched to this buffer)
//   PLAYING → EMPTY (audio thread finished with this buffer, moved to other)

enum class StreamBufferState : int {
    EMPTY   = 0,
    LOADING = 1,
    READY   = 2,
    PLAYING = 3
};

// ─────────────────────────────────────────────────────────────────────────────
// SourceStream — file handle + double buffers for the media file
// ─────────────────────────────────────────────────────────────────────────────

struct SourceStream {
    std::string filePath;

    // ── File handle (loader + control thread, protected by fileMutex) ────
    SndFilePtr  sndFile;
    SF_INFO     sfInfo = {};
    std::mutex  fileMutex;

    // Interleaved read scratch (chunkFrames × channels). Loader-owned.
    std::vector<float> interleaved;

    // ── Double buffers (mono) ────────────────────────────────────────────
    std::vector<float> bufferA;
    std::vector<float> bufferB;

    // The audio thread switches the active buffer inside the logically-const
    // getSample(), so these are mutable.
    mutable std::atomic<StreamBufferState> stateA{StreamBufferState::EMPTY};
    mutable std::atomic<StreamBufferState> stateB{StreamBufferState::EMPTY};

    std::atomic<uint64_t> chunkStartA{0};
    std::atomic<uint64_t> chunkStartB{0};
    std::atomic<uint64_t> validFramesA{0};
    std::atomic<uint64_t> validFramesB{0};

    mutable std::atomic<int> activeBuffer{-1};  // -1 = no buffer active yet

    // ── Media info ───────────────────────────────────────────────────────
    uint64_t totalFrames = 0;
    int      sampleRate  = 0;
    int      channels    = 0;
    uint64_t chunkFrames = 0;

    SourceStream() = default;
    SourceStream(const SourceStream&) = delete;
    SourceStream& operator=(const SourceStream&) = delete;

    /// Open the file header and pre-allocate buffers. Returns true on success.
    bool open(const std::string& path, uint64_t chunkSize) {
        filePath = path;
        chunkFrames = chunkSize > 0 ? chunkSize : 1;

        sndFile = WavUtils::openForRead(path, sfInfo);
        if (!sndFile) {
            std::cerr << "[Streaming] ERROR: Cannot open media: " << path
                      << " — " << sf_strerror(nullptr) << std::endl;
            return false;
        }
        if (sfInfo.channels < 1) {
            std::cerr << "[Streaming] ERROR: Media has no channels: " << path << std::endl;
            sndFile.reset();
            return false;
        }

        totalFrames = sfInfo.frames > 0 ? static_cast<uint64_t>(sfInfo.frames) : 0;
        sampleRate  = sfInfo.samplerate;
        channels    = sfInfo.channels;

        // Pre-allocate everything (no allocation during playback).
        interleaved.assign(chunkFrames * static_cast<uint64_t>(channels), 0.0f);
        bufferA.assign(chunkFrames, 0.0f);
        bufferB.assign(chunkFrames, 0.0f);
        return true;
    }

    /// Read + downmix one chunk into the given buffer slot.
    /// Returns the number of frames loaded.
    uint64_t loadChunkInto(int bufIdx, uint64_t fileFrame) {
        auto& buffer = (bufIdx == 0) ? bufferA : bufferB;
        auto& state  = (bufIdx == 0) ? stateA  : stateB;
        auto& start  = (bufIdx == 0) ? chunkStartA : chunkStartB;
        auto& valid  = (bufIdx == 0) ? validFramesA : validFramesB;

        state.store(StreamBufferState::LOADING, std::memory_order_release);

        uint64_t framesToRead = chunkFrames;
        if (fileFrame + framesToRead > totalFrames) {
            framesToRead = (fileFrame < totalFrames) ? (totalFrames - fileFrame) : 0;
        }

        sf_count_t read = 0;
        if (framesToRead > 0 && sndFile) {
            std::lock_guard<std::mutex> lock(fileMutex);
            if (sf_seek(sndFile.get(), static_cast<sf_count_t>(fileFrame), SEEK_SET) >= 0) {
                read = sf_readf_float(sndFile.get(), interleaved.data(),
                                      static_cast<sf_count_t>(framesToRead));
            }
            if (read < 0) read = 0;
        }

        WavUtils::downmixInterleaved(interleaved.data(), channels,
                                     static_cast<size_t>(read), buffer.data());
        if (static_cast<uint64_t>(read) < chunkFrames) {
            std::memset(buffer.data() + read, 0,
                        (chunkFrames - static_cast<uint64_t>(read)) * sizeof(float));
        }

        start.store(fileFrame, std::memory_order_release);
        valid.store(static_cast<uint64_t>(read), std::memory_order_release);
        state.store(StreamBufferState::READY, std::memory_order_release);
        return static_cast<uint64_t>(read);
    }

    /// Load chunk 0 into buffer A and make it active. Control thread only,
    /// while the audio thread is not reading the stream.
    bool loadFirstChunk() {
        activeBuffer.store(-1, std::memory_order_release);
        stateB.store(StreamBufferState::EMPTY, std::memory_order_release);
        validFramesB.store(0, std::memory_order_release);

        const uint64_t read = loadChunkInto(0, 0);
        if (read == 0 && totalFrames > 0) {
            std::cerr << "[Streaming] ERROR: Failed to read first chunk of "
                      << filePath << std::endl;
            stateA.store(StreamBufferState::EMPTY, std::memory_order_release);
            return false;
        }

        activeBuffer.store(0, std::memory_order_release);
        stateA.store(StreamBufferState::PLAYING, std::memory_order_release);
        return true;
    }

    /// Sample at a global frame. Audio thread only; lock-free.
    /// Returns 0.0f when the frame is not in a loaded buffer (underrun or EOF).
    float getSample(uint64_t globalFrame) const {
        int active = activeBuffer.load(std::memory_order_acquire);
        if (active < 0) return 0.0f;

        const auto& buffer = (active == 0) ? bufferA : bufferB;
        uint64_t bufStart  = (active == 0)
            ? chunkStartA.load(std::memory_order_acquire)
            : chunkStartB.load(std::memory_order_acquire);
        uint64_t bufValid  = (active == 0)
            ? validFramesA.load(std::memory_order_acquire)
            : validFramesB.load(std::memory_order_acquire);

        if (globalFrame >= bufStart && globalFrame < bufStart + bufValid) {
            return buffer[globalFrame - bufStart];
        }

        int other = 1 - active;
        const auto& otherBuf = (other == 0) ? bufferA : bufferB;
        auto otherState = (other == 0)
            ? stateA.load(std::memory_order_acquire)
            : stateB.load(std::memory_order_acquire);
        uint64_t otherStart = (other == 0)
            ? chunkStartA.load(std::memory_order_acquire)
            : chunkStartB.load(std::memory_order_acquire);
        uint64_t otherValid = (other == 0)
            ? validFramesA.load(std::memory_order_acquire)
            : validFramesB.load(std::memory_order_acquire);

        if (otherState == StreamBufferState::READY &&
            globalFrame >= otherStart && globalFrame < otherStart + otherValid) {
            auto& curState = (active == 0) ? stateA : stateB;
            auto& othState = (other == 0)  ? stateA : stateB;
            curState.store(StreamBufferState::EMPTY, std::memory_order_release);
            othState.store(StreamBufferState::PLAYING, std::memory_order_release);
            activeBuffer.store(other, std::memory_order_release);
            return otherBuf[globalFrame - otherStart];
        }

        return 0.0f;
    }

    void close() {
        std::lock_guard<std::mutex> lock(fileMutex);
        sndFile.reset();
        activeBuffer.store(-1, std::memory_order_release);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Streaming — owns the source stream and the background loader
// ─────────────────────────────────────────────────────────────────────────────

class Streaming {
public:

    using EndOfStreamHandler = std::function<void(uint64_t scheduleId)>;

    explicit Streaming(EngineState& state) : mState(state) {}

    ~Streaming() { close(); }

    Streaming(const Streaming&) = delete;
    Streaming& operator=(const Streaming&) = delete;

    // ── Open the media file ──────────────────────────────────────────────
    // Replaces any previous file. Call only while nothing is scheduled.

    bool open(const std::string& path, uint64_t chunkFrames) {
        close();

        auto stream = std::make_unique<SourceStream>();
        if (!stream->open(path, chunkFrames)) {
            return false;
        }

        std::cout << "[Streaming] Opened " << path << " — "
                  << stream->totalFrames << " frames, "
                  << stream->channels << " ch @ " << stream->sampleRate << " Hz";
        if (stream->channels > 1) std::cout << " (downmixed to mono)";
        std::cout << std::endl;

        mStream = std::move(stream);
        return true;
    }

    /// Register the end-of-stream handler. Must be called before startLoader().
    void setEndOfStreamHandler(EndOfStreamHandler handler) {
        mOnEndOfStream = std::move(handler);
    }

    // ── Rewind to frame 0 ────────────────────────────────────────────────
    // Synchronously reloads the first chunk. Control thread, unscheduled.

    bool rewind() {
        if (!mStream) return false;
        std::lock_guard<std::mutex> lock(mScanMutex);
        return mStream->loadFirstChunk();
    }

    // ── Loader thread ────────────────────────────────────────────────────

    void startLoader() {
        if (mLoaderThread.joinable()) return;
        mLoaderRunning.store(true, std::memory_order_release);
        mLoaderThread = std::thread([this]() { loaderWorker(); });
        std::cout << "[Streaming] Background loader thread started." << std::endl;
    }

    void stopLoader() {
        mLoaderRunning.store(false, std::memory_order_release);
        if (mLoaderThread.joinable()) {
            mLoaderThread.join();
        }
    }

    // ── End-of-stream arming ─────────────────────────────────────────────
    // The loader reports end-of-stream at most once per armed schedule id.

    void armEndOfStream(uint64_t scheduleId) {
        mArmedSchedule.store(scheduleId, std::memory_order_release);
    }

    void disarmEndOfStream() {
        mArmedSchedule.store(0, std::memory_order_release);
    }

    // ── Block read for the audio callback ────────────────────────────────
    // Copies a contiguous block from the active buffer when possible.
    // MUST stay lock-free.

    void getBlock(uint64_t startFrame, unsigned int numFrames, float* outBuffer) const {
        if (!mStream) {
            std::memset(outBuffer, 0, numFrames * sizeof(float));
            return;
        }

        const SourceStream& src = *mStream;
        int active = src.activeBuffer.load(std::memory_order_acquire);
        if (active < 0) {
            std::memset(outBuffer, 0, numFrames * sizeof(float));
            return;
        }

        const auto& buffer = (active == 0) ? src.bufferA : src.bufferB;
        uint64_t bufStart  = (active == 0)
            ? src.chunkStartA.load(std::memory_order_acquire)
            : src.chunkStartB.load(std::memory_order_acquire);
        uint64_t bufValid  = (active == 0)
            ? src.validFramesA.load(std::memory_order_acquire)
            : src.validFramesB.load(std::memory_order_acquire);

        const uint64_t endFrame = startFrame + numFrames;
        if (startFrame >= bufStart && endFrame <= bufStart + bufValid) {
            std::memcpy(outBuffer, buffer.data() + (startFrame - bufStart),
                        numFrames * sizeof(float));
            return;
        }

        // Block spans a chunk boundary or the end of the media.
        for (unsigned int i = 0; i < numFrames; ++i) {
            outBuffer[i] = src.getSample(startFrame + i);
        }
    }

    // ── Queries ──────────────────────────────────────────────────────────

    bool     isOpen()      const { return mStream != nullptr; }
    uint64_t totalFrames() const { return mStream ? mStream->totalFrames : 0; }
    int      sampleRate()  const { return mStream ? mStream->sampleRate : 0; }
    int      channels()    const { return mStream ? mStream->channels : 0; }

    // ── Shutdown ─────────────────────────────────────────────────────────
    // Only after the output has stopped reading the buffers.

    void close() {
        stopLoader();
        disarmEndOfStream();
        if (mStream) {
            mStream->close();
            mStream.reset();
            std::cout << "[Streaming] Closed." << std::endl;
        }
    }

private:

    void loaderWorker() {
        while (mLoaderRunning.load(std::memory_order_acquire)) {
            {
                std::lock_guard<std::mutex> lock(mScanMutex);
                if (mStream) {
                    const uint64_t currentFrame =
                        mState.frameCounter.load(std::memory_order_relaxed);
                    preloadIfNeeded(currentFrame);
                    checkEndOfStream(currentFrame);
                }
            }
            std::this_thread::sleep_for(kLoaderPollInterval);
        }
    }

    void preloadIfNeeded(uint64_t currentFrame) {
        SourceStream& stream = *mStream;
        int active = stream.activeBuffer.load(std::memory_order_acquire);
        if (active < 0) return;

        uint64_t activeStart = (active == 0)
            ? stream.chunkStartA.load(std::memory_order_acquire)
            : stream.chunkStartB.load(std::memory_order_acquire);
        uint64_t activeValid = (active == 0)
            ? stream.validFramesA.load(std::memory_order_acquire)
            : stream.validFramesB.load(std::memory_order_acquire);

        int inactive = 1 - active;
        auto inactiveState = (inactive == 0)
            ? stream.stateA.load(std::memory_order_acquire)
            : stream.stateB.load(std::memory_order_acquire);

        if (activeValid > 0 && inactiveState == StreamBufferState::EMPTY) {
            uint64_t threshold = activeStart +
                static_cast<uint64_t>(activeValid * kPreloadThreshold);
            if (currentFrame >= threshold) {
                uint64_t nextChunkStart = activeStart + stream.chunkFrames;
                if (nextChunkStart < stream.totalFrames) {
                    stream.loadChunkInto(inactive, nextChunkStart);
                }
            }
        }
    }

    void checkEndOfStream(uint64_t currentFrame) {
        uint64_t armed = mArmedSchedule.load(std::memory_order_acquire);
        if (armed == 0 || currentFrame < mStream->totalFrames) return;

        // Claim this schedule so the handler fires once.
        if (mArmedSchedule.compare_exchange_strong(armed, 0, std::memory_order_acq_rel)) {
            if (mOnEndOfStream) mOnEndOfStream(armed);
        }
    }

    // ── Member data ──────────────────────────────────────────────────────

    EngineState&                  mState;
    std::unique_ptr<SourceStream> mStream;
    EndOfStreamHandler            mOnEndOfStream;

    std::atomic<uint64_t>         mArmedSchedule{0};

    std::mutex                    mScanMutex;
    std::thread                   mLoaderThread;
    std::atomic<bool>             mLoaderRunning{false};
};
