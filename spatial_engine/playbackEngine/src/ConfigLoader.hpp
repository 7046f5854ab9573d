// ConfigLoader.hpp — Player configuration from JSON
//
// Reads the static player constants (overhead height, trajectory bounds,
// tick rate, temp directory, audio settings) with nlohmann/json. Every key is
// optional; type errors and out-of-range values throw std::runtime_error.
// Command-line flags in main.cpp override the loaded values.

#pragma once

#include <string>

#include "PlaybackTypes.hpp"

// Static player configuration. Every field has a default; a JSON file and
// the command line only override what they mention.
struct PlayerConfig {
    // ── Trajectory ──────────────────────────────────────────────────────
    float            heightY = 1.2f;          // overhead plane (m)
    TrajectoryBounds bounds;                  // includes rangeMeters
    MotionMode       mode = MotionMode::Manual;

    // ── Session ─────────────────────────────────────────────────────────
    double      tickRateHz = 60.0;            // display refresh
    std::string tempDir;                      // empty → Transcoder::defaultTempDir()

    // ── Audio ───────────────────────────────────────────────────────────
    int   bufferSize     = 512;
    int   outputChannels = 2;
    float masterGain     = 0.8f;
    float focus          = 1.0f;              // DBAP rolloff exponent
    float earRadius      = 1.0f;
};

class ConfigLoader {
public:
    /// Load a player config JSON file. Missing keys keep their defaults.
    /// Throws std::runtime_error if the file cannot be read or a value is
    /// out of range.
    static PlayerConfig load(const std::string& path);

    /// Same as load(), from JSON text.
    static PlayerConfig loadFromString(const std::string& text);

    /// Copy the audio settings into the engine config (before prepare()).
    static void applyTo(const PlayerConfig& player, EngineConfig& engine);
};
