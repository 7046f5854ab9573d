// SessionController: load → play → stop → reset, ticks and observers.

#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <vector>

#include "SessionController.hpp"
#include "TestSupport.hpp"

using namespace std::chrono_literals;
using testsupport::DeniedAccess;
using testsupport::ManualAudioOutput;
using testsupport::TempDir;
using testsupport::writeSineWav;

namespace {

constexpr int kRate   = 8000;
constexpr int kBuffer = 500;

PlayerConfig testPlayerConfig() {
    PlayerConfig c;
    c.heightY = 1.2f;
    c.bounds.frontZ = -1.0f;
    c.bounds.backZ = 1.0f;
    c.bounds.leftX = -1.0f;
    c.bounds.rightX = 1.0f;
    c.bounds.rangeMeters = 1.5f;
    c.bounds.orbitRadius = 1.0f;
    c.bounds.orbitPeriodSec = 8.0f;
    c.tickRateHz = 100.0;
    c.bufferSize = kBuffer;
    return c;
}

struct SessionRig {
    TempDir           dir;
    ControlQueue      control;
    EngineConfig      config;
    EngineState       state;
    ManualAudioOutput output;
    PlayerConfig      player = testPlayerConfig();
    SpatialEngine     engine{config, state, output, control};
    Transcoder        transcoder{dir.file("transcoded")};
    SessionController session{player, engine, transcoder, control};
    LocalFileAccess   access;

    SessionRig() {
        ConfigLoader::applyTo(player, config);
    }

    std::string tempDir() const { return dir.file("transcoded"); }

    /// Load and drain the control queue until the result has been applied.
    bool loadAndWait(const std::string& path) {
        session.load(path, access);
        return control.runUntil([&] {
            return !session.isLoadPending() &&
                   session.status() != PlaybackStatus::Transcoding;
        }, 10000ms);
    }
};

} // namespace

TEST_CASE("start prepares the engine and reports Ready", "[session]") {
    SessionRig rig;
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.session.status() == PlaybackStatus::Ready);
    REQUIRE(rig.engine.phase() == EnginePhase::Prepared);

    const SessionSnapshot s = rig.session.snapshot();
    REQUIRE_FALSE(s.isPlaying);
    REQUIRE(s.progress == 0.0f);
    REQUIRE(s.position.y == 1.2f);

    // Idempotent.
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.session.status() == PlaybackStatus::Ready);
}

TEST_CASE("play without a file is rejected without changing status", "[session]") {
    SessionRig rig;
    REQUIRE(rig.session.start().ok());

    EngineResult r = rig.session.play();
    REQUIRE(r.error == EngineError::NoMediaLoaded);
    REQUIRE(rig.session.status() == PlaybackStatus::Ready);
    REQUIRE_FALSE(rig.session.isTicking());
}

TEST_CASE("Loading a file transcodes it and selects it", "[session][load]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 10.0, kRate, 2);
    REQUIRE(rig.session.start().ok());

    std::vector<PlaybackStatus> seen;
    rig.session.subscribe([&](const SessionSnapshot& s) { seen.push_back(s.status); });

    rig.session.beginSelection();
    REQUIRE(rig.session.status() == PlaybackStatus::Selecting);

    REQUIRE(rig.loadAndWait(src));
    REQUIRE(rig.session.status() == PlaybackStatus::FileSelected);

    const PlaybackSession& s = rig.session.session();
    REQUIRE(s.hasMedia);
    REQUIRE(s.durationSeconds == Approx(10.0));
    REQUIRE(s.progress == 0.0f);
    REQUIRE_FALSE(s.isPlaying);
    REQUIRE(s.media.path != src);
    REQUIRE(std::filesystem::exists(s.media.path));
    REQUIRE(rig.engine.phase() == EnginePhase::Loaded);
    REQUIRE(rig.engine.mediaPath() == s.media.path);

    REQUIRE(seen.front() == PlaybackStatus::Selecting);
    REQUIRE(std::find(seen.begin(), seen.end(), PlaybackStatus::Transcoding) != seen.end());
    REQUIRE(seen.back() == PlaybackStatus::FileSelected);
}

TEST_CASE("Progress and position follow the render clock", "[session][tick]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 10.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(src));

    rig.session.setMode(MotionMode::FrontBack);
    REQUIRE(rig.session.snapshot().position.z == -1.0f);

    REQUIRE(rig.session.play().ok());
    REQUIRE(rig.session.status() == PlaybackStatus::Playing);
    REQUIRE(rig.session.isTicking());

    REQUIRE(rig.output.renderBlocks(40) == 40);   // 2.5 s
    rig.session.tick();

    const SessionSnapshot s = rig.session.snapshot();
    REQUIRE(s.progress == Approx(0.25f));
    REQUIRE(s.position.z == Approx(-0.5f));
    REQUIRE(s.position.y == 1.2f);
    REQUIRE(rig.engine.position().z == Approx(-0.5f));
}

TEST_CASE("The tick timer drives updates while playing", "[session][tick]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 10.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(src));

    rig.session.setMode(MotionMode::LeftRight);
    REQUIRE(rig.session.play().ok());
    rig.output.renderBlocks(80);   // 5 s

    REQUIRE(rig.control.runUntil([&] { return rig.session.snapshot().progress > 0.0f; }, 2000ms));
    REQUIRE(rig.session.snapshot().progress == Approx(0.5f));
    REQUIRE(rig.session.snapshot().position.x == Approx(0.0f).margin(1e-5));
}

TEST_CASE("Stop mid-file returns progress to zero", "[session][stop]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 10.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(src));
    REQUIRE(rig.session.play().ok());

    rig.output.renderBlocks(96);   // 6 s
    rig.session.tick();
    REQUIRE(rig.session.snapshot().progress == Approx(0.6f));

    rig.session.stop();
    REQUIRE(rig.session.snapshot().progress == 0.0f);
    REQUIRE(rig.session.status() == PlaybackStatus::Stopped);
    REQUIRE_FALSE(rig.session.snapshot().isPlaying);
    REQUIRE_FALSE(rig.session.isTicking());
    REQUIRE_FALSE(rig.engine.isPlaying());

    // Ticks that were already queued do nothing.
    const Position3D before = rig.session.snapshot().position;
    rig.control.runFor(50ms);
    REQUIRE(rig.session.snapshot().progress == 0.0f);
    REQUIRE(rig.session.snapshot().position.z == before.z);

    // Play again starts from the top.
    REQUIRE(rig.session.play().ok());
    REQUIRE(rig.session.snapshot().progress == 0.0f);
}

TEST_CASE("start while playing stops the session with the engine", "[session][stop]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 10.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(src));
    REQUIRE(rig.session.play().ok());

    rig.output.renderBlocks(32);   // 2 s
    rig.session.tick();
    REQUIRE(rig.session.snapshot().progress == Approx(0.2f));

    REQUIRE(rig.session.start().ok());
    REQUIRE_FALSE(rig.engine.isPlaying());
    REQUIRE_FALSE(rig.session.snapshot().isPlaying);
    REQUIRE(rig.session.snapshot().progress == 0.0f);
    REQUIRE_FALSE(rig.session.isTicking());
    REQUIRE(rig.session.status() == PlaybackStatus::Stopped);
    REQUIRE(rig.session.session().hasMedia);

    REQUIRE(rig.session.play().ok());
    REQUIRE(rig.session.isTicking());
    REQUIRE(rig.session.status() == PlaybackStatus::Playing);
}

TEST_CASE("End of file stops the session and freezes the source", "[session][eof]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 1.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(src));

    rig.session.setMode(MotionMode::FrontBack);
    REQUIRE(rig.session.play().ok());
    REQUIRE(rig.output.renderBlocks(16) == 16);

    REQUIRE(rig.control.runUntil([&] { return !rig.session.session().isPlaying; }, 3000ms));
    REQUIRE(rig.session.status() == PlaybackStatus::Stopped);
    REQUIRE(rig.session.snapshot().progress == 0.0f);
    REQUIRE_FALSE(rig.session.isTicking());
    REQUIRE_FALSE(rig.engine.isPlaying());

    const Position3D frozen = rig.engine.position();
    rig.session.tick();
    rig.control.runFor(50ms);
    REQUIRE(rig.engine.position().x == frozen.x);
    REQUIRE(rig.engine.position().z == frozen.z);
}

TEST_CASE("Only the latest of overlapping loads becomes active", "[session][load]") {
    SessionRig rig;
    const std::string first  = writeSineWav(rig.dir.file("first.wav"), 1.0, kRate);
    const std::string second = writeSineWav(rig.dir.file("second.wav"), 2.0, kRate);
    REQUIRE(rig.session.start().ok());

    rig.session.load(first, rig.access);
    const uint64_t firstGeneration = rig.session.loadGeneration();
    REQUIRE(rig.loadAndWait(second));
    REQUIRE(rig.session.loadGeneration() == firstGeneration + 1);

    REQUIRE(rig.session.status() == PlaybackStatus::FileSelected);
    REQUIRE(rig.session.session().durationSeconds == Approx(2.0));

    // Whatever the first job produced is discarded.
    REQUIRE(rig.control.runUntil([&] {
        return TempDir::countTranscoded(rig.tempDir()) == 1;
    }, 10000ms));
    rig.control.runFor(50ms);
    REQUIRE(rig.session.session().durationSeconds == Approx(2.0));
    REQUIRE(rig.engine.durationSeconds() == Approx(2.0));
}

TEST_CASE("play is refused while a new file is transcoding", "[session][load]") {
    SessionRig rig;
    const std::string first  = writeSineWav(rig.dir.file("first.wav"), 2.0, kRate);
    const std::string second = writeSineWav(rig.dir.file("second.wav"), 3.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(first));
    REQUIRE(rig.session.play().ok());
    rig.output.renderBlocks(4);

    rig.session.load(second, rig.access);
    REQUIRE(rig.session.isLoadPending());

    const EngineResult r = rig.session.play();
    REQUIRE_FALSE(r.ok());
    REQUIRE(r.error == EngineError::NoMediaLoaded);
    REQUIRE(rig.session.status() == PlaybackStatus::Transcoding);
    REQUIRE_FALSE(rig.engine.isPlaying());
    REQUIRE_FALSE(rig.session.isTicking());

    REQUIRE(rig.control.runUntil([&] {
        return !rig.session.isLoadPending() &&
               rig.session.status() != PlaybackStatus::Transcoding;
    }, 10000ms));
    REQUIRE(rig.session.status() == PlaybackStatus::FileSelected);
    REQUIRE(rig.session.session().durationSeconds == Approx(3.0));
    REQUIRE_FALSE(rig.session.snapshot().isPlaying);
    REQUIRE_FALSE(rig.session.isTicking());
}

TEST_CASE("A failed load reports an error and clears the old file", "[session][load]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 1.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(src));
    REQUIRE(TempDir::countTranscoded(rig.tempDir()) == 1);

    REQUIRE(rig.loadAndWait(rig.dir.file("missing.m4a")));
    REQUIRE(rig.session.status() == PlaybackStatus::Error);
    REQUIRE(rig.session.snapshot().errorMessage.rfind("SourceUnreadable", 0) == 0);
    REQUIRE_FALSE(rig.session.session().hasMedia);
    REQUIRE(rig.engine.phase() == EnginePhase::Prepared);
    REQUIRE(TempDir::countTranscoded(rig.tempDir()) == 0);

    REQUIRE(rig.session.play().error == EngineError::NoMediaLoaded);
}

TEST_CASE("Denied read access fails the load", "[session][load]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 1.0, kRate);
    REQUIRE(rig.session.start().ok());

    DeniedAccess denied;
    rig.session.load(src, denied);
    REQUIRE(rig.control.runUntil([&] { return !rig.session.isLoadPending(); }, 10000ms));

    REQUIRE(rig.session.status() == PlaybackStatus::Error);
    REQUIRE(denied.released == 0);
    REQUIRE(TempDir::countTranscoded(rig.tempDir()) == 0);
}

TEST_CASE("A zero-length file is rejected by the engine", "[session][load]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("silence.wav"), 0.0, kRate);
    REQUIRE(rig.session.start().ok());

    REQUIRE(rig.loadAndWait(src));
    REQUIRE(rig.session.status() == PlaybackStatus::Error);
    REQUIRE(rig.session.snapshot().errorMessage.rfind("InvalidDuration", 0) == 0);
    REQUIRE(TempDir::countTranscoded(rig.tempDir()) == 0);
}

TEST_CASE("reset returns to a clean slate", "[session][reset]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 2.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(src));
    REQUIRE(rig.session.play().ok());
    rig.output.renderBlocks(4);

    rig.session.reset();
    REQUIRE(rig.session.status() == PlaybackStatus::Ready);
    REQUIRE_FALSE(rig.session.session().hasMedia);
    REQUIRE(rig.session.session().durationSeconds == 0.0);
    REQUIRE_FALSE(rig.session.isTicking());
    REQUIRE(rig.engine.phase() == EnginePhase::Prepared);
    REQUIRE(rig.engine.durationSeconds() == 0.0);
    REQUIRE(TempDir::countTranscoded(rig.tempDir()) == 0);
}

TEST_CASE("reset during a transcode drops its result", "[session][reset]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 2.0, kRate);
    REQUIRE(rig.session.start().ok());

    rig.session.load(src, rig.access);
    rig.session.reset();
    REQUIRE(rig.session.status() == PlaybackStatus::Ready);

    rig.control.runFor(300ms);
    REQUIRE(rig.session.status() == PlaybackStatus::Ready);
    REQUIRE_FALSE(rig.session.session().hasMedia);
    REQUIRE(rig.control.runUntil([&] {
        return TempDir::countTranscoded(rig.tempDir()) == 0;
    }, 10000ms));
}

TEST_CASE("Pad moves switch to manual and start playback", "[session][manual]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 10.0, kRate);
    REQUIRE(rig.session.start().ok());

    REQUIRE(rig.session.moveSource(0.5f, 0.5f).error == EngineError::NoMediaLoaded);

    REQUIRE(rig.loadAndWait(src));
    rig.session.setMode(MotionMode::OverheadOrbit);

    REQUIRE(rig.session.moveSource(3.0f, -0.4f).ok());
    const SessionSnapshot s = rig.session.snapshot();
    REQUIRE(s.mode == MotionMode::Manual);
    REQUIRE(s.position.x == 1.5f);
    REQUIRE(s.position.y == 1.2f);
    REQUIRE(s.position.z == -0.4f);
    REQUIRE(s.status == PlaybackStatus::Playing);
    REQUIRE(rig.engine.isPlaying());

    // Manual ticks hold the pad position.
    rig.output.renderBlocks(20);
    rig.session.tick();
    REQUIRE(rig.session.snapshot().position.x == 1.5f);
    REQUIRE(rig.session.snapshot().position.z == -0.4f);
}

TEST_CASE("Continuous orbit follows elapsed seconds", "[session][time]") {
    SessionRig rig;
    const std::string src = writeSineWav(rig.dir.file("voice.wav"), 4.0, kRate);
    REQUIRE(rig.session.start().ok());
    REQUIRE(rig.loadAndWait(src));

    rig.session.setMode(MotionMode::ContinuousOrbit);
    REQUIRE(rig.session.play().ok());
    rig.output.renderBlocks(32);   // 2 s → a quarter turn of an 8 s orbit
    rig.session.tick();

    const Position3D expected = Trajectory::positionAtTime(
        MotionMode::ContinuousOrbit, 2.0, 1.2f, rig.player.bounds);
    const SessionSnapshot s = rig.session.snapshot();
    REQUIRE(s.position.x == Approx(expected.x).margin(1e-5));
    REQUIRE(s.position.z == Approx(expected.z).margin(1e-5));
    REQUIRE(s.progress == Approx(0.5f));
}

TEST_CASE("Observers can unsubscribe", "[session][observe]") {
    SessionRig rig;
    int calls = 0;
    const int token = rig.session.subscribe([&](const SessionSnapshot&) { ++calls; });

    REQUIRE(rig.session.start().ok());
    const int afterStart = calls;
    REQUIRE(afterStart > 0);

    rig.session.unsubscribe(token);
    rig.session.beginSelection();
    REQUIRE(calls == afterStart);
}

TEST_CASE("Destroying the session removes its temp file", "[session]") {
    TempDir dir;
    const std::string src = writeSineWav(dir.file("voice.wav"), 1.0, kRate);
    const std::string temp = dir.file("transcoded");
    {
        ControlQueue      control;
        EngineConfig      config;
        EngineState       state;
        ManualAudioOutput output;
        PlayerConfig      player = testPlayerConfig();
        SpatialEngine     engine(config, state, output, control);
        Transcoder        transcoder(temp);
        SessionController session(player, engine, transcoder, control);
        LocalFileAccess   access;

        REQUIRE(session.start().ok());
        session.load(src, access);
        REQUIRE(control.runUntil([&] { return !session.isLoadPending(); }, 10000ms));
        REQUIRE(session.session().hasMedia);
        REQUIRE(TempDir::countTranscoded(temp) == 1);
    }
    REQUIRE(TempDir::countTranscoded(temp) == 0);
}
