#include "ConfigLoader.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Read an optional float, rejecting non-numeric values.
static void readFloat(const json& j, const char* key, float& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_number()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be a number");
    }
    out = j[key].get<float>();
    if (!std::isfinite(out)) {
        throw std::runtime_error(std::string("Config key '") + key + "' is not finite");
    }
}

static void readInt(const json& j, const char* key, int& out) {
    if (!j.contains(key)) return;
    if (!j[key].is_number_integer()) {
        throw std::runtime_error(std::string("Config key '") + key + "' must be an integer");
    }
    out = j[key].get<int>();
}

static void parseBounds(const json& b, TrajectoryBounds& bounds) {
    readFloat(b, "frontZ", bounds.frontZ);
    readFloat(b, "backZ", bounds.backZ);
    readFloat(b, "leftX", bounds.leftX);
    readFloat(b, "rightX", bounds.rightX);
    readFloat(b, "bottomY", bounds.bottomY);
    readFloat(b, "topY", bounds.topY);
    readFloat(b, "orbitRadius", bounds.orbitRadius);
    readFloat(b, "orbitPeriodSec", bounds.orbitPeriodSec);
}

static PlayerConfig parse(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Player config must be a JSON object");
    }

    PlayerConfig c;

    readFloat(j, "heightY", c.heightY);
    readFloat(j, "rangeMeters", c.bounds.rangeMeters);

    if (j.contains("tickRateHz")) {
        if (!j["tickRateHz"].is_number()) {
            throw std::runtime_error("Config key 'tickRateHz' must be a number");
        }
        c.tickRateHz = j["tickRateHz"].get<double>();
    }
    if (j.contains("tempDir")) {
        c.tempDir = j["tempDir"].get<std::string>();
    }
    if (j.contains("mode")) {
        const std::string name = j["mode"].get<std::string>();
        if (!parseMotionMode(name, c.mode)) {
            std::cerr << "[Config] WARNING: unknown motion mode '" << name
                      << "', using manual" << std::endl;
            c.mode = MotionMode::Manual;
        }
    }

    if (j.contains("bounds")) {
        parseBounds(j["bounds"], c.bounds);
    }

    if (j.contains("audio")) {
        const json& a = j["audio"];
        readInt(a, "bufferSize", c.bufferSize);
        readFloat(a, "masterGain", c.masterGain);
        readFloat(a, "focus", c.focus);
        readFloat(a, "earRadius", c.earRadius);
    }

    // ── Range checks ─────────────────────────────────────────────────────
    if (c.bufferSize <= 0) {
        throw std::runtime_error("audio.bufferSize must be positive");
    }
    if (!(c.tickRateHz > 0.0)) {
        throw std::runtime_error("tickRateHz must be positive");
    }
    if (c.bounds.rangeMeters < 0.0f) {
        throw std::runtime_error("rangeMeters must not be negative");
    }
    if (c.masterGain < 0.0f) {
        std::cerr << "[Config] WARNING: negative masterGain clamped to 0" << std::endl;
        c.masterGain = 0.0f;
    }

    return c;
}

// Wrong JSON types surface as std::runtime_error like every other config error.
static PlayerConfig parseChecked(const json& j) {
    try {
        return parse(j);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Bad player config value: ") + e.what());
    }
}

PlayerConfig ConfigLoader::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) throw std::runtime_error("Cannot open player config JSON: " + path);

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }

    std::cout << "[Config] Loaded " << path << std::endl;
    return parseChecked(j);
}

PlayerConfig ConfigLoader::loadFromString(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Invalid player config JSON: ") + e.what());
    }
    return parseChecked(j);
}

void ConfigLoader::applyTo(const PlayerConfig& player, EngineConfig& engine) {
    engine.bufferSize     = player.bufferSize;
    engine.outputChannels = player.outputChannels;
    engine.spatialFocus   = player.focus;
    engine.earRadius      = player.earRadius;
    engine.masterGain.store(player.masterGain, std::memory_order_relaxed);
}
