// main.cpp — overheadPad binaural player entry point
//
// This is the CLI entry point for the playback engine. It:
//   1. Parses command-line arguments and the optional JSON config
//   2. Creates the EngineConfig / EngineState and the control queue
//   3. Builds the graph owner (SpatialEngine over AlloLib AudioIO)
//   4. Creates the Transcoder and the SessionController
//   5. Prepares the engine, transcodes + loads the file, starts playback
//   6. Drains the control queue (ticks, completions) and prints status
//      until the file ends or Ctrl+C
//   7. Shuts down cleanly (session → engine → output)
//
// Usage:
//   ./overheadPad_player --file ../media/voice.flac \
//       [--config player.json] \
//       [--mode overhead_orbit] \
//       [--height 1.2] \
//       [--gain 0.8] \
//       [--buffersize 512]

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "ConfigLoader.hpp"
#include "ControlQueue.hpp"
#include "OutputBackend.hpp"
#include "PlaybackTypes.hpp"
#include "SessionController.hpp"
#include "SpatialEngine.hpp"
#include "Transcoder.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// Signal handling for clean shutdown on Ctrl+C
// ─────────────────────────────────────────────────────────────────────────────

static std::atomic<bool> g_shouldExit{false};

void signalHandler(int signum) {
    (void)signum;
    g_shouldExit.store(true);
}

// ─────────────────────────────────────────────────────────────────────────────
// Argument parsing helpers
// ─────────────────────────────────────────────────────────────────────────────

/// Look up a string argument by name. Returns empty string if not found.
static std::string getArgString(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string(argv[i]) == flag) {
            return std::string(argv[i + 1]);
        }
    }
    return "";
}

/// Look up an integer argument by name. Returns defaultVal if absent or bad.
static int getArgInt(int argc, char* argv[], const std::string& flag, int defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (!val.empty()) {
        try { return std::stoi(val); }
        catch (const std::exception&) {
            std::cerr << "[Main] WARNING: " << flag << " expects an integer, got '"
                      << val << "'" << std::endl;
        }
    }
    return defaultVal;
}

/// Look up a float argument by name. Returns defaultVal if absent or bad.
static float getArgFloat(int argc, char* argv[], const std::string& flag, float defaultVal) {
    std::string val = getArgString(argc, argv, flag);
    if (!val.empty()) {
        try { return std::stof(val); }
        catch (const std::exception&) {
            std::cerr << "[Main] WARNING: " << flag << " expects a number, got '"
                      << val << "'" << std::endl;
        }
    }
    return defaultVal;
}

/// Check if a flag is present (no value).
static bool hasArg(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Usage / help
// ─────────────────────────────────────────────────────────────────────────────

static void printUsage(const char* progName) {
    std::cout << "\noverheadPad Binaural Player\n"
              << "───────────────────────────────────────────────────────────────────\n"
              << "Usage: " << progName << " --file <path> [options]\n\n"
              << "Required:\n"
              << "  --file <path>       Audio file to play (anything libsndfile decodes)\n\n"
              << "Optional:\n"
              << "  --config <path>     Player config JSON (bounds, height, audio settings)\n"
              << "  --mode <name>       manual | front_back | left_right | bottom_top |\n"
              << "                      overhead_orbit | parabolic_rise | continuous_orbit\n"
              << "  --height <float>    Overhead plane height in metres (default: 1.2)\n"
              << "  --gain <float>      Master gain 0.0–1.0 (default: 0.8)\n"
              << "  --buffersize <int>  Frames per audio callback (default: 512)\n"
              << "  --help              Show this message\n"
              << std::endl;
}

// ─────────────────────────────────────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {

    if (hasArg(argc, argv, "--help") || hasArg(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    std::cout << "\n╔══════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║  overheadPad Binaural Player                             ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════╝\n" << std::endl;

    // ── Configuration: file first, then command-line overrides ───────────

    PlayerConfig player;
    const std::string configPath = getArgString(argc, argv, "--config");
    if (!configPath.empty()) {
        try {
            player = ConfigLoader::load(configPath);
        } catch (const std::exception& e) {
            std::cerr << "[Main] FATAL: Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }

    const std::string filePath = getArgString(argc, argv, "--file");
    if (filePath.empty()) {
        std::cerr << "[Main] ERROR: --file is required." << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    const std::string modeName = getArgString(argc, argv, "--mode");
    if (!modeName.empty() && !parseMotionMode(modeName, player.mode)) {
        std::cerr << "[Main] ERROR: Unknown mode '" << modeName << "'." << std::endl;
        printUsage(argv[0]);
        return 1;
    }
    player.heightY    = getArgFloat(argc, argv, "--height", player.heightY);
    player.masterGain = getArgFloat(argc, argv, "--gain", player.masterGain);
    player.bufferSize = getArgInt(argc, argv, "--buffersize", player.bufferSize);
    if (player.tempDir.empty()) {
        player.tempDir = Transcoder::defaultTempDir();
    }

    if (player.bufferSize <= 0) {
        std::cerr << "[Main] ERROR: --buffersize must be positive." << std::endl;
        return 1;
    }

    std::cout << "[Main] Configuration:" << std::endl;
    std::cout << "  File:         " << filePath << std::endl;
    std::cout << "  Mode:         " << motionModeName(player.mode) << std::endl;
    std::cout << "  Height:       " << player.heightY << " m" << std::endl;
    std::cout << "  Range:        ±" << player.bounds.rangeMeters << " m" << std::endl;
    std::cout << "  Buffer size:  " << player.bufferSize << " frames" << std::endl;
    std::cout << "  Master gain:  " << player.masterGain << std::endl;
    std::cout << "  Tick rate:    " << player.tickRateHz << " Hz" << std::endl;
    std::cout << "  Temp dir:     " << player.tempDir << std::endl;
    std::cout << std::endl;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    // ── Build the pipeline ───────────────────────────────────────────────

    ControlQueue    control;
    EngineConfig    engineConfig;
    EngineState     state;
    ConfigLoader::applyTo(player, engineConfig);

    AlloAudioOutput   output;
    SpatialEngine     engine(engineConfig, state, output, control);
    Transcoder        transcoder(player.tempDir);
    SessionController session(player, engine, transcoder, control);

    PlaybackStatus lastStatus = session.status();
    bool started = false;
    session.subscribe([&](const SessionSnapshot& s) {
        if (s.status != lastStatus) {
            std::cout << "\n[Main] Status: " << statusName(s.status);
            if (!s.errorMessage.empty()) std::cout << " — " << s.errorMessage;
            std::cout << std::endl;
            lastStatus = s.status;
        }
    });

    EngineResult prepared = session.start();
    if (!prepared.ok()) {
        std::cerr << "[Main] FATAL: " << describe(prepared) << std::endl;
        return 1;
    }

    LocalFileAccess access;
    session.load(filePath, access);

    // ── Control loop ─────────────────────────────────────────────────────
    // Drains ticks and completions; prints status twice a second.

    int exitCode = 0;
    auto nextReport = std::chrono::steady_clock::now();
    uint64_t framesRendered = 0;  // the clock rewinds at end of file and on stop

    while (!g_shouldExit.load()) {
        control.waitAndProcess(std::chrono::milliseconds(20));
        framesRendered = std::max(framesRendered,
                                  state.frameCounter.load(std::memory_order_relaxed));

        const PlaybackStatus status = session.status();
        if (status == PlaybackStatus::Error) {
            exitCode = 1;
            break;
        }
        if (status == PlaybackStatus::FileSelected && !started) {
            EngineResult r = session.play();
            if (!r.ok()) {
                exitCode = 1;
                break;
            }
            started = true;
        }
        if (status == PlaybackStatus::Stopped && started) {
            break;  // end of file
        }

        const auto now = std::chrono::steady_clock::now();
        if (status == PlaybackStatus::Playing && now >= nextReport) {
            const SessionSnapshot s = session.snapshot();
            std::cout << "\r  Time: " << std::fixed << std::setprecision(1)
                      << state.playbackTimeSec.load(std::memory_order_relaxed) << "s / "
                      << s.durationSeconds << "s"
                      << "  |  Progress: " << std::setprecision(2) << s.progress
                      << "  |  Pos: (" << s.position.x << ", " << s.position.y
                      << ", " << s.position.z << ")"
                      << "  |  CPU: " << std::setprecision(1)
                      << (state.cpuLoad.load(std::memory_order_relaxed) * 100.0f) << "%"
                      << "     " << std::flush;
            nextReport = now + std::chrono::milliseconds(500);
        }
    }

    if (g_shouldExit.load()) {
        std::cout << "\n[Main] Interrupt received. Shutting down..." << std::endl;
    }

    // ── Clean shutdown ───────────────────────────────────────────────────

    framesRendered = std::max(framesRendered,
                              state.frameCounter.load(std::memory_order_relaxed));
    session.stop();
    session.reset();
    control.processPending();

    std::cout << "\n[Main] Final stats:" << std::endl;
    std::cout << "  Total frames: " << framesRendered << std::endl;
    std::cout << "[Main] Goodbye." << std::endl;
    return exitCode;
}
