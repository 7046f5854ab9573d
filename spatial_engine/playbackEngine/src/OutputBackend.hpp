// OutputBackend.hpp — Agent 8: Audio Output Adapter
//
// Abstracts the output sink of the audio graph. SpatialEngine renders through
// the AudioRenderer interface; an AudioOutput drives that renderer from its
// audio thread. AlloAudioOutput wraps AlloLib's AudioIO and is the ONLY class
// that touches the audio device. Tests substitute an output that calls the
// renderer block by block on the test thread.
//
// RESPONSIBILITIES:
// 1. Activate the output session (a usable default output device).
// 2. Open the device at the media's sample rate with two output channels.
// 3. Register the static audio callback that dispatches to the renderer.
// 4. Start / stop / close the stream; report CPU load.
//
// DESIGN NOTES:
// - The callback function is static (required by AlloLib's C-style callback).
//   It receives `this` via the userData pointer and forwards to the renderer.
// - The renderer pointer is set in open() while the stream is stopped and is
//   read-only on the audio thread afterwards.
//
// REFERENCE: AlloLib AudioIO API
//   AudioIO::init(callback, userData, framesPerBuf, framesPerSec, outChans, inChans)
//   AudioIO::open() / start() / stop() / close()
//   AudioIO::cpu() → current audio thread CPU load

#pragma once

#include <iostream>

#include "al/io/al_AudioIO.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// AudioRenderer — what the output calls once per block (audio thread)
// ─────────────────────────────────────────────────────────────────────────────

class AudioRenderer {
public:
    virtual ~AudioRenderer() = default;

    /// Fill io's output buffers. MUST NOT allocate, lock, or do I/O.
    virtual void processBlock(al::AudioIOData& io) = 0;
};

struct OutputSettings {
    int sampleRate     = 48000;
    int bufferSize     = 512;
    int outputChannels = 2;
};

// ─────────────────────────────────────────────────────────────────────────────
// AudioOutput — output sink interface
// ─────────────────────────────────────────────────────────────────────────────

class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    /// Make sure an output session exists. Idempotent.
    virtual bool activateSession() = 0;

    /// Open (or re-open) the sink with the given format. The sink must be
    /// stopped. The renderer must outlive the open sink.
    virtual bool open(const OutputSettings& settings, AudioRenderer* renderer) = 0;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual void close() = 0;

    virtual bool isOpen() const = 0;
    virtual bool isRunning() = 0;

    /// Frames per callback actually granted by the sink.
    virtual int framesPerBuffer() const = 0;

    /// Audio thread CPU load (0–1); 0 if unknown.
    virtual double cpuLoad() const { return 0.0; }
};

// ─────────────────────────────────────────────────────────────────────────────
// AlloAudioOutput — AlloLib AudioIO wrapper
// ─────────────────────────────────────────────────────────────────────────────

class AlloAudioOutput : public AudioOutput {
public:

    AlloAudioOutput() = default;

    ~AlloAudioOutput() override {
        close();
    }

    AlloAudioOutput(const AlloAudioOutput&) = delete;
    AlloAudioOutput& operator=(const AlloAudioOutput&) = delete;

    bool activateSession() override {
        if (mSessionActive) return true;

        al::AudioDevice device = al::AudioDevice::defaultOutput();
        if (!device.valid()) {
            std::cerr << "[Backend] ERROR: No default output device available." << std::endl;
            return false;
        }
        std::cout << "[Backend] Output session on: " << device.name() << std::endl;
        mSessionActive = true;
        return true;
    }

    bool open(const OutputSettings& settings, AudioRenderer* renderer) override {
        if (!mSessionActive && !activateSession()) {
            return false;
        }
        close();

        std::cout << "[Backend] Opening audio device..." << std::endl;
        std::cout << "  Sample rate:      " << settings.sampleRate << " Hz" << std::endl;
        std::cout << "  Buffer size:      " << settings.bufferSize << " frames" << std::endl;
        std::cout << "  Output channels:  " << settings.outputChannels << std::endl;

        mRenderer = renderer;
        mAudioIO.init(
            audioCallback,                   // static callback function
            this,                            // userData → passed back in callback
            settings.bufferSize,             // frames per buffer
            (double)settings.sampleRate,     // sample rate
            settings.outputChannels,         // output channels
            0                                // no input
        );

        if (!mAudioIO.open()) {
            std::cerr << "[Backend] ERROR: Failed to open audio device." << std::endl;
            mRenderer = nullptr;
            return false;
        }

        mOpen = true;
        std::cout << "  Actual output channels: " << mAudioIO.channelsOut() << std::endl;
        std::cout << "  Actual buffer size:     " << mAudioIO.framesPerBuffer() << std::endl;
        return true;
    }

    bool start() override {
        if (!mOpen) {
            std::cerr << "[Backend] ERROR: Cannot start — device not open." << std::endl;
            return false;
        }
        if (mAudioIO.isRunning()) return true;

        if (!mAudioIO.start()) {
            std::cerr << "[Backend] ERROR: Failed to start audio stream." << std::endl;
            return false;
        }
        std::cout << "[Backend] Audio stream started." << std::endl;
        return true;
    }

    void stop() override {
        if (mOpen && mAudioIO.isRunning()) {
            mAudioIO.stop();
            std::cout << "[Backend] Audio stream stopped." << std::endl;
        }
    }

    void close() override {
        stop();
        if (mOpen) {
            mAudioIO.close();
            mOpen = false;
            std::cout << "[Backend] Audio device closed." << std::endl;
        }
        mRenderer = nullptr;
    }

    bool isOpen() const override { return mOpen; }

    bool isRunning() override { return mOpen && mAudioIO.isRunning(); }

    int framesPerBuffer() const override {
        return static_cast<int>(mAudioIO.framesPerBuffer());
    }

    double cpuLoad() const override { return mAudioIO.cpu(); }

private:

    static void audioCallback(al::AudioIOData& io) {
        AlloAudioOutput* self = static_cast<AlloAudioOutput*>(io.user());
        if (self && self->mRenderer) {
            self->mRenderer->processBlock(io);
        } else {
            io.zeroOut();
        }
    }

    al::AudioIO     mAudioIO;
    AudioRenderer*  mRenderer = nullptr;
    bool            mSessionActive = false;
    bool            mOpen = false;
};
