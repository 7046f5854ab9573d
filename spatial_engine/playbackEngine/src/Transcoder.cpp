#include "Transcoder.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <unistd.h>

#include "WavUtils.hpp"

namespace fs = std::filesystem;

// ─────────────────────────────────────────────────────────────────────────────
// Read access
// ─────────────────────────────────────────────────────────────────────────────

bool LocalFileAccess::acquire(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    std::ifstream probe(path, std::ios::binary);
    return probe.good();
}

ScopedReadAccess::ScopedReadAccess(ReadAccessProvider& provider, std::string path)
    : mProvider(&provider), mPath(std::move(path)) {
    mGranted = mProvider->acquire(mPath);
}

ScopedReadAccess::ScopedReadAccess(ScopedReadAccess&& other) noexcept
    : mProvider(other.mProvider),
      mPath(std::move(other.mPath)),
      mGranted(other.mGranted) {
    other.mProvider = nullptr;
    other.mGranted = false;
}

ScopedReadAccess& ScopedReadAccess::operator=(ScopedReadAccess&& other) noexcept {
    if (this != &other) {
        release();
        mProvider = other.mProvider;
        mPath = std::move(other.mPath);
        mGranted = other.mGranted;
        other.mProvider = nullptr;
        other.mGranted = false;
    }
    return *this;
}

void ScopedReadAccess::release() {
    if (mGranted && mProvider) {
        mProvider->release(mPath);
    }
    mGranted = false;
    mProvider = nullptr;
}

// ─────────────────────────────────────────────────────────────────────────────
// TranscodeJob
// ─────────────────────────────────────────────────────────────────────────────

TranscodeJob::~TranscodeJob() {
    cancel();
    wait();
}

void TranscodeJob::wait() {
    if (mThread.joinable() && mThread.get_id() != std::this_thread::get_id()) {
        mThread.join();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Transcoder
// ─────────────────────────────────────────────────────────────────────────────

Transcoder::Transcoder(std::string tempDir, uint64_t chunkFrames)
    : mTempDir(std::move(tempDir)),
      mChunkFrames(chunkFrames > 0 ? chunkFrames : 65536) {}

std::string Transcoder::defaultTempDir() {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) base = "/tmp";
    return (base / ("overheadPad-" + std::to_string(::getpid()))).string();
}

std::string Transcoder::makeOutputPath() const {
    static std::mutex sMutex;
    static std::mt19937_64 sRng{std::random_device{}()};
    static uint64_t sCounter = 0;

    uint64_t a, b;
    {
        std::lock_guard<std::mutex> lock(sMutex);
        a = sRng();
        b = sRng() ^ ++sCounter;
    }

    std::ostringstream name;
    name << "transcoded-" << std::hex << std::setfill('0')
         << std::setw(16) << a << std::setw(16) << b << ".wav";
    return (fs::path(mTempDir) / name.str()).string();
}

TranscodeResult Transcoder::transcode(const std::string& sourcePath,
                                      const std::atomic<bool>* cancel) const {
    TranscodeResult out;

    // ── Destination directory ────────────────────────────────────────────
    std::error_code ec;
    fs::create_directories(mTempDir, ec);
    if (ec || !fs::is_directory(mTempDir)) {
        out.result = EngineResult::failure(EngineError::TranscodeBackendUnavailable,
                                           "temp directory unusable: " + mTempDir);
        return out;
    }

    // ── Source ───────────────────────────────────────────────────────────
    SF_INFO inInfo;
    SndFilePtr in = WavUtils::openForRead(sourcePath, inInfo);
    if (!in) {
        out.result = EngineResult::failure(EngineError::SourceUnreadable,
                                           sourcePath + ": " + sf_strerror(nullptr));
        return out;
    }
    if (inInfo.channels < 1 || inInfo.samplerate <= 0) {
        out.result = EngineResult::failure(EngineError::SourceUnreadable,
                                           sourcePath + ": no decodable audio stream");
        return out;
    }

    // ── Destination file ─────────────────────────────────────────────────
    const std::string destPath = makeOutputPath();
    fs::remove(destPath, ec);

    SndFilePtr dest;
    try {
        dest = WavUtils::openFloatWavForWrite(destPath, inInfo.channels, inInfo.samplerate,
                                             inInfo.frames);
    } catch (const std::runtime_error& e) {
        out.result = EngineResult::failure(EngineError::TranscodeBackendUnavailable, e.what());
        return out;
    }

    auto abandon = [&](EngineError error, const std::string& detail) {
        dest.reset();
        std::error_code rmEc;
        fs::remove(destPath, rmEc);
        out.result = EngineResult::failure(error, detail);
        return out;
    };

    // ── Decode → encode, chunk by chunk ──────────────────────────────────
    std::vector<float> chunk(mChunkFrames * static_cast<uint64_t>(inInfo.channels));
    uint64_t written = 0;

    while (true) {
        if (cancel && cancel->load()) {
            return abandon(EngineError::TranscodeCancelled, sourcePath);
        }

        const sf_count_t got = sf_readf_float(in.get(), chunk.data(),
                                              static_cast<sf_count_t>(mChunkFrames));
        if (got < 0) {
            return abandon(EngineError::TranscodeFailed,
                           "decode error in " + sourcePath + ": " + sf_strerror(in.get()));
        }
        if (got == 0) break;

        const sf_count_t put = sf_writef_float(dest.get(), chunk.data(), got);
        if (put != got) {
            return abandon(EngineError::TranscodeFailed,
                           "write error in " + destPath + ": " + sf_strerror(dest.get()));
        }
        written += static_cast<uint64_t>(got);
    }

    if (sf_error(in.get()) != SF_ERR_NO_ERROR) {
        return abandon(EngineError::TranscodeFailed,
                       "decode error in " + sourcePath + ": " + sf_strerror(in.get()));
    }
    dest.reset();  // flush + close the header

    // ── Readability check ────────────────────────────────────────────────
    SF_INFO checkInfo;
    SndFilePtr check = WavUtils::openForRead(destPath, checkInfo);
    if (!check || static_cast<uint64_t>(checkInfo.frames) != written) {
        check.reset();
        return abandon(EngineError::TranscodeFailed,
                       "output not readable: " + destPath);
    }

    out.result = EngineResult::success();
    out.media.path       = destPath;
    out.media.sampleRate = checkInfo.samplerate;
    out.media.channels   = checkInfo.channels;
    out.media.frames     = written;

    std::cout << "[Transcoder] " << sourcePath << " → " << destPath << " ("
              << out.media.durationSeconds() << " s, " << out.media.channels
              << " ch @ " << out.media.sampleRate << " Hz)" << std::endl;
    return out;
}

std::unique_ptr<TranscodeJob> Transcoder::transcodeAsync(const std::string& sourcePath,
                                                         ScopedReadAccess access,
                                                         DoneHandler onDone) const {
    auto job = std::make_unique<TranscodeJob>();

    // The worker gets its own copy so the job may outlive this Transcoder.
    Transcoder self = *this;
    auto cancel = job->mCancel;
    auto done   = job->mDone;

    job->mThread = std::thread(
        [self, sourcePath, cancel, done, onDone = std::move(onDone),
         access = std::move(access)]() mutable {
            TranscodeResult result;
            if (!access.granted()) {
                result.result = EngineResult::failure(EngineError::SourceUnreadable,
                                                      "read access denied: " + sourcePath);
            } else {
                result = self.transcode(sourcePath, cancel.get());
            }
            access.release();

            if (onDone) onDone(std::move(result));
            done->store(true);
        });

    return job;
}
