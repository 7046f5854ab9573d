// ConfigLoader: player JSON → PlayerConfig / EngineConfig.

#include <catch2/catch.hpp>

#include <fstream>
#include <stdexcept>

#include "ConfigLoader.hpp"
#include "TestSupport.hpp"

using testsupport::TempDir;

TEST_CASE("An empty object keeps every default", "[config]") {
    const PlayerConfig c = ConfigLoader::loadFromString("{}");
    const PlayerConfig d;
    REQUIRE(c.heightY == d.heightY);
    REQUIRE(c.mode == MotionMode::Manual);
    REQUIRE(c.tickRateHz == d.tickRateHz);
    REQUIRE(c.bufferSize == 512);
    REQUIRE(c.bounds.rangeMeters == d.bounds.rangeMeters);
    REQUIRE(c.tempDir.empty());
}

TEST_CASE("Full player config parses", "[config]") {
    const PlayerConfig c = ConfigLoader::loadFromString(R"({
        "heightY": 1.5,
        "rangeMeters": 2.0,
        "mode": "parabolic_rise",
        "tickRateHz": 30,
        "tempDir": "/tmp/overheadPad-config-test",
        "bounds": {
            "frontZ": -2.0, "backZ": 2.0,
            "leftX": -1.0, "rightX": 1.0,
            "bottomY": 0.2, "topY": 3.0,
            "orbitRadius": 1.25, "orbitPeriodSec": 6
        },
        "audio": {
            "bufferSize": 256,
            "masterGain": 0.5, "focus": 1.5, "earRadius": 0.5
        }
    })");

    REQUIRE(c.heightY == 1.5f);
    REQUIRE(c.bounds.rangeMeters == 2.0f);
    REQUIRE(c.mode == MotionMode::ParabolicRise);
    REQUIRE(c.tickRateHz == 30.0);
    REQUIRE(c.tempDir == "/tmp/overheadPad-config-test");
    REQUIRE(c.bounds.frontZ == -2.0f);
    REQUIRE(c.bounds.topY == 3.0f);
    REQUIRE(c.bounds.orbitRadius == 1.25f);
    REQUIRE(c.bounds.orbitPeriodSec == 6.0f);
    REQUIRE(c.bufferSize == 256);
    REQUIRE(c.masterGain == 0.5f);
    REQUIRE(c.focus == 1.5f);
    REQUIRE(c.earRadius == 0.5f);

    EngineConfig engine;
    ConfigLoader::applyTo(c, engine);
    REQUIRE(engine.bufferSize == 256);
    REQUIRE(engine.spatialFocus == 1.5f);
    REQUIRE(engine.earRadius == 0.5f);
    REQUIRE(engine.masterGain.load() == 0.5f);
}

TEST_CASE("Unknown modes fall back to manual", "[config]") {
    const PlayerConfig c = ConfigLoader::loadFromString(R"({"mode": "spiral"})");
    REQUIRE(c.mode == MotionMode::Manual);
}

TEST_CASE("Invalid values are rejected", "[config]") {
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString("not json"), std::runtime_error);
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString("[1, 2]"), std::runtime_error);
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString(R"({"heightY": "high"})"), std::runtime_error);
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString(R"({"audio": {"bufferSize": 0}})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString(R"({"audio": {"bufferSize": 12.5}})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString(R"({"tickRateHz": 0})"), std::runtime_error);
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString(R"({"rangeMeters": -1})"), std::runtime_error);
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString(R"({"mode": 3})"), std::runtime_error);
    REQUIRE_THROWS_AS(ConfigLoader::loadFromString(R"({"tempDir": false})"), std::runtime_error);
}

TEST_CASE("Negative master gain is clamped to silence", "[config]") {
    const PlayerConfig c = ConfigLoader::loadFromString(R"({"audio": {"masterGain": -0.3}})");
    REQUIRE(c.masterGain == 0.0f);
}

TEST_CASE("Config files load from disk", "[config]") {
    TempDir dir;
    const std::string path = dir.file("player.json");
    std::ofstream(path) << R"({"heightY": 0.9, "mode": "front_back"})";

    const PlayerConfig c = ConfigLoader::load(path);
    REQUIRE(c.heightY == 0.9f);
    REQUIRE(c.mode == MotionMode::FrontBack);

    REQUIRE_THROWS_AS(ConfigLoader::load(dir.file("missing.json")), std::runtime_error);
}
