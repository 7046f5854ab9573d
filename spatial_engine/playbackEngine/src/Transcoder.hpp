// Transcoder.hpp — Decode arbitrary input media into engine-ready PCM
//
// Reads any container libsndfile can decode and writes a 32-bit float WAV at
// the source's native rate and channel count into the temp directory, under a
// fresh unique name per call. The result can be opened by Streaming for
// random access.
//
// THREADING:
//   transcode() is synchronous and touches no shared state, so it can run on
//   any thread. transcodeAsync() runs it on a worker thread owned by the
//   returned TranscodeJob and invokes onDone from that worker; callers hop
//   back onto the control context themselves (ControlQueue::post()).
//
// CANCELLATION:
//   The cancel flag is polled between chunks. A cancelled or failed job
//   removes its partial output file.

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "PlaybackTypes.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// TranscodeResult
// ─────────────────────────────────────────────────────────────────────────────

struct TranscodeResult {
    EngineResult     result;
    EngineReadyMedia media;   // valid only when ok()

    bool ok() const { return result.ok(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// Read access — acquire before reading the source, release on every exit path
// ─────────────────────────────────────────────────────────────────────────────

class ReadAccessProvider {
public:
    virtual ~ReadAccessProvider() = default;
    virtual bool acquire(const std::string& path) = 0;
    virtual void release(const std::string& path) = 0;
};

/// Plain filesystem access: granted when the file exists and can be opened.
class LocalFileAccess : public ReadAccessProvider {
public:
    bool acquire(const std::string& path) override;
    void release(const std::string&) override {}
};

/// RAII guard around a ReadAccessProvider grant. Movable, so it can travel
/// with an async job; releases exactly once.
class ScopedReadAccess {
public:
    ScopedReadAccess() = default;
    ScopedReadAccess(ReadAccessProvider& provider, std::string path);
    ~ScopedReadAccess() { release(); }

    ScopedReadAccess(ScopedReadAccess&& other) noexcept;
    ScopedReadAccess& operator=(ScopedReadAccess&& other) noexcept;
    ScopedReadAccess(const ScopedReadAccess&) = delete;
    ScopedReadAccess& operator=(const ScopedReadAccess&) = delete;

    bool granted() const { return mGranted; }
    const std::string& path() const { return mPath; }

    void release();

private:
    ReadAccessProvider* mProvider = nullptr;
    std::string         mPath;
    bool                mGranted = false;
};

// ─────────────────────────────────────────────────────────────────────────────
// TranscodeJob — handle to an in-flight async transcode
// ─────────────────────────────────────────────────────────────────────────────

class TranscodeJob {
public:
    TranscodeJob() : mCancel(std::make_shared<std::atomic<bool>>(false)),
                     mDone(std::make_shared<std::atomic<bool>>(false)) {}

    /// Cancels and joins.
    ~TranscodeJob();

    TranscodeJob(const TranscodeJob&) = delete;
    TranscodeJob& operator=(const TranscodeJob&) = delete;

    void cancel() { mCancel->store(true); }
    bool isCancelled() const { return mCancel->load(); }
    bool isDone() const { return mDone->load(); }

    /// Block until the worker (including onDone) has finished.
    void wait();

private:
    friend class Transcoder;

    std::shared_ptr<std::atomic<bool>> mCancel;
    std::shared_ptr<std::atomic<bool>> mDone;
    std::thread                        mThread;
};

// ─────────────────────────────────────────────────────────────────────────────
// Transcoder
// ─────────────────────────────────────────────────────────────────────────────

class Transcoder {
public:

    using DoneHandler = std::function<void(TranscodeResult)>;

    explicit Transcoder(std::string tempDir, uint64_t chunkFrames = 65536);

    /// Decode `sourcePath` into a new float WAV. Never throws.
    TranscodeResult transcode(const std::string& sourcePath,
                              const std::atomic<bool>* cancel = nullptr) const;

    /// Run transcode() on a worker thread. `access` is released as soon as
    /// the source has been read, before onDone runs. If access was not
    /// granted, onDone receives SourceUnreadable without decoding.
    std::unique_ptr<TranscodeJob> transcodeAsync(const std::string& sourcePath,
                                                 ScopedReadAccess access,
                                                 DoneHandler onDone) const;

    /// Fresh `<tempDir>/transcoded-<hex>.wav`; unique per call in this process.
    std::string makeOutputPath() const;

    const std::string& tempDir() const { return mTempDir; }

    /// Process-scoped default temp directory.
    static std::string defaultTempDir();

private:
    std::string mTempDir;
    uint64_t    mChunkFrames;
};
