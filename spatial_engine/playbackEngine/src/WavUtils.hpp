// WavUtils.hpp — libsndfile helpers shared by the transcoder and tests
//
// RAII ownership of SNDFILE handles, float WAV / RF64 creation, and the
// interleaved-to-mono downmix used by the streaming source.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <sndfile.h>

// Closes a libsndfile handle when the owning pointer goes out of scope.
struct SndFileCloser {
    void operator()(SNDFILE* snd) const {
        if (snd) sf_close(snd);
    }
};

using SndFilePtr = std::unique_ptr<SNDFILE, SndFileCloser>;

// One vector per channel, all the same length.
struct MultiWavData {
    int sampleRate = 0;
    int channels = 0;
    std::vector<std::vector<float>> samples;
};

namespace WavUtils {

    // Open any libsndfile-readable file. Null on failure; info is filled on success.
    SndFilePtr openForRead(const std::string& path, SF_INFO& info);

    // Largest data chunk a plain WAV header can describe.
    constexpr sf_count_t kWavMaxBytes = 0xFFFFFFFF;

    // SF_FORMAT_WAV | FLOAT, or RF64 | FLOAT when the float data for
    // `frames` frames would exceed the WAV 4 GB limit.
    int floatFormatFor(int channels, sf_count_t frames);

    // Open a 32-bit float WAV (RF64 past 4 GB) for writing `frames` frames.
    // Throws std::runtime_error on failure.
    SndFilePtr openFloatWavForWrite(const std::string& path, int channels,
                                    int sampleRate, sf_count_t frames);

    // Average interleaved frames to mono: out[i] = mean of frame i's channels.
    void downmixInterleaved(const float* interleaved, int channels,
                            size_t frames, float* out);

    void writeMultichannelWav(const std::string& path, const MultiWavData& mw);
}
