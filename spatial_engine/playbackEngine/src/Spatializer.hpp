// Spatializer.hpp — Agent 3: Binaural DBAP Panning
//
// Renders the mono source block from Streaming at the current source
// position into the two output channels (left ear, right ear) with AlloLib's
// DBAP (Distance-Based Amplitude Panning). The "speaker array" is a pair of
// virtual ears at ±90° azimuth, earRadius metres from the listener at the
// origin, so the inter-ear level difference follows the source's lateral
// position and the overall level follows its distance.
//
// RESPONSIBILITIES:
// 1. Build the two-ear al::Speakers array at init (0-based channels:
//    0 = left ear, 1 = right ear).
// 2. Create al::Dbap with the configured focus.
// 3. For each audio block, read the source block, apply master gain, and
//    render it at the block's position into the internal render buffer.
// 4. Copy the render buffer into the device output channels.
//
// COORDINATES:
//   Positions arrive in listener space (x right, y up, -z front), the same
//   convention al::Dbap::renderBuffer() takes, so no transform is applied.
//
// THREADING:
//   init() runs on the control thread while the output is stopped.
//   renderBlock() runs on the audio thread and exclusively owns mRenderIO
//   and mSourceBuffer while the output is running.
//
// REAL-TIME SAFETY:
// - renderBlock(): no allocation, no I/O, no locks. Buffers are sized at
//   init for the largest block the output will request.

#pragma once

#include <algorithm>
#include <cstring>
#include <iostream>
#include <memory>
#include <vector>

#include "al/io/al_AudioIO.hpp"
#include "al/math/al_Vec.hpp"
#include "al/sound/al_Dbap.hpp"
#include "al/sound/al_Speaker.hpp"

#include "PlaybackTypes.hpp"
#include "Streaming.hpp"

static constexpr int kEarChannels = 2;

class Spatializer {
public:

    Spatializer() = default;

    // ── Initialize the ear pair and panner ───────────────────────────────
    // Safe to call again (e.g. after the media sample rate changes) as long
    // as the output is not running.

    bool init(int sampleRate, int framesPerBuffer, float focus, float earRadius) {
        if (sampleRate <= 0 || framesPerBuffer <= 0) {
            std::cerr << "[Spatializer] ERROR: Invalid render format ("
                      << sampleRate << " Hz, " << framesPerBuffer << " frames)." << std::endl;
            return false;
        }

        const float radius = earRadius > 0.0f ? earRadius : 1.0f;

        // Resolve which azimuth sign lands on the listener's left (-x).
        const float leftAz = al::Speaker(0, 90.0f, 0.0f, 0, radius).vec().x < 0.0
                             ? 90.0f : -90.0f;

        mSpeakers.clear();
        mSpeakers.emplace_back(al::Speaker(0, leftAz, 0.0f, 0, radius));    // left ear
        mSpeakers.emplace_back(al::Speaker(1, -leftAz, 0.0f, 0, radius));   // right ear

        mDBap = std::make_unique<al::Dbap>(mSpeakers, focus);

        mCapacity = static_cast<unsigned int>(framesPerBuffer);
        mSourceBuffer.assign(mCapacity, 0.0f);

        mRenderIO.framesPerBuffer(mCapacity);
        mRenderIO.framesPerSecond(sampleRate);
        mRenderIO.channelsIn(0);
        mRenderIO.channelsOut(kEarChannels);

        mInitialized = true;

        std::cout << "[Spatializer] Ear pair at ±90° (r=" << radius
                  << " m), DBAP focus=" << focus << ", "
                  << mCapacity << " frames @ " << sampleRate << " Hz." << std::endl;
        return true;
    }

    // ── Render one audio block ───────────────────────────────────────────
    // io output buffers must be zeroed BEFORE calling this method.
    // Returns the number of frames rendered.

    unsigned int renderBlock(al::AudioIOData& io,
                             const Streaming& streaming,
                             const al::Vec3f& position,
                             float gain,
                             uint64_t currentFrame,
                             unsigned int numFrames) {
        if (!mInitialized) return 0;
        numFrames = std::min(numFrames, mCapacity);

        streaming.getBlock(currentFrame, numFrames, mSourceBuffer.data());
        for (unsigned int f = 0; f < numFrames; ++f) {
            mSourceBuffer[f] *= gain;
        }

        mRenderIO.zeroOut();
        mDBap->renderBuffer(mRenderIO, position, mSourceBuffer.data(), numFrames);

        const unsigned int copyChannels = std::min(
            static_cast<unsigned int>(kEarChannels),
            static_cast<unsigned int>(io.channelsOut()));
        for (unsigned int ch = 0; ch < copyChannels; ++ch) {
            const float* src = mRenderIO.outBuffer(ch);
            float* dst = io.outBuffer(ch);
            for (unsigned int f = 0; f < numFrames; ++f) {
                dst[f] += src[f];
            }
        }
        return numFrames;
    }

    bool isInitialized() const { return mInitialized; }
    unsigned int capacity() const { return mCapacity; }

private:
    al::Speakers               mSpeakers;
    std::unique_ptr<al::Dbap>  mDBap;
    al::AudioIOData            mRenderIO;
    std::vector<float>         mSourceBuffer;
    unsigned int               mCapacity = 0;
    bool                       mInitialized = false;
};
