#include "WavUtils.hpp"

#include <iostream>
#include <stdexcept>

SndFilePtr WavUtils::openForRead(const std::string& path, SF_INFO& info) {
    info = {};
    return SndFilePtr(sf_open(path.c_str(), SFM_READ, &info));
}

int WavUtils::floatFormatFor(int channels, sf_count_t frames) {
    const sf_count_t dataSizeBytes = frames * channels * static_cast<sf_count_t>(sizeof(float));
    if (dataSizeBytes > kWavMaxBytes) {
        return SF_FORMAT_RF64 | SF_FORMAT_FLOAT;
    }
    return SF_FORMAT_WAV | SF_FORMAT_FLOAT;
}

SndFilePtr WavUtils::openFloatWavForWrite(const std::string& path, int channels,
                                          int sampleRate, sf_count_t frames) {
    SF_INFO info = {};
    info.channels = channels;
    info.samplerate = sampleRate;
    info.format = floatFormatFor(channels, frames);

    if ((info.format & SF_FORMAT_TYPEMASK) == SF_FORMAT_RF64) {
        std::cout << "NOTE: Using RF64 for " << path << " (data exceeds WAV 4 GB limit)"
                  << std::endl;
    }

    if (!sf_format_check(&info)) {
        throw std::runtime_error("Unsupported WAV format for: " + path);
    }

    SndFilePtr snd(sf_open(path.c_str(), SFM_WRITE, &info));
    if (!snd) {
        throw std::runtime_error("Cannot create WAV file: " + path + " ("
                                 + sf_strerror(nullptr) + ")");
    }
    return snd;
}

void WavUtils::downmixInterleaved(const float* interleaved, int channels,
                                  size_t frames, float* out) {
    if (channels == 1) {
        for (size_t i = 0; i < frames; ++i) out[i] = interleaved[i];
        return;
    }
    const float scale = 1.0f / static_cast<float>(channels);
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        const float* frame = interleaved + i * channels;
        for (int ch = 0; ch < channels; ++ch) sum += frame[ch];
        out[i] = sum * scale;
    }
}

void WavUtils::writeMultichannelWav(const std::string& path, const MultiWavData& mw) {
    if (mw.channels <= 0 || mw.samples.size() != static_cast<size_t>(mw.channels)) {
        throw std::runtime_error("Channel data does not match channel count: " + path);
    }

    const size_t totalSamples = mw.samples[0].size();
    SndFilePtr snd = openFloatWavForWrite(path, mw.channels, mw.sampleRate,
                                          static_cast<sf_count_t>(totalSamples));

    std::vector<float> interleaved(totalSamples * mw.channels);
    for (size_t i = 0; i < totalSamples; i++) {
        for (int ch = 0; ch < mw.channels; ch++) {
            interleaved[i * mw.channels + ch] = mw.samples[ch][i];
        }
    }

    const sf_count_t written = sf_write_float(snd.get(), interleaved.data(),
                                              static_cast<sf_count_t>(interleaved.size()));
    if (written != static_cast<sf_count_t>(interleaved.size())) {
        std::cerr << "Write error: " << sf_strerror(snd.get()) << "\n";
        throw std::runtime_error("Short write to WAV file: " + path);
    }
}
