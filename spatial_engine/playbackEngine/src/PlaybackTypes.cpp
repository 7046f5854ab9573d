#include "PlaybackTypes.hpp"

const char* motionModeName(MotionMode mode) {
    switch (mode) {
        case MotionMode::Manual:          return "manual";
        case MotionMode::FrontBack:       return "front_back";
        case MotionMode::LeftRight:       return "left_right";
        case MotionMode::BottomTop:       return "bottom_top";
        case MotionMode::OverheadOrbit:   return "overhead_orbit";
        case MotionMode::ParabolicRise:   return "parabolic_rise";
        case MotionMode::ContinuousOrbit: return "continuous_orbit";
    }
    return "manual";
}

bool parseMotionMode(const std::string& name, MotionMode& out) {
    static const MotionMode kAll[] = {
        MotionMode::Manual,        MotionMode::FrontBack,
        MotionMode::LeftRight,     MotionMode::BottomTop,
        MotionMode::OverheadOrbit, MotionMode::ParabolicRise,
        MotionMode::ContinuousOrbit
    };
    for (MotionMode m : kAll) {
        if (name == motionModeName(m)) {
            out = m;
            return true;
        }
    }
    return false;
}

const char* errorName(EngineError error) {
    switch (error) {
        case EngineError::None:                        return "None";
        case EngineError::NotPrepared:                 return "NotPrepared";
        case EngineError::NoMediaLoaded:               return "NoMediaLoaded";
        case EngineError::SourceUnreadable:            return "SourceUnreadable";
        case EngineError::TranscodeBackendUnavailable: return "TranscodeBackendUnavailable";
        case EngineError::TranscodeFailed:             return "TranscodeFailed";
        case EngineError::TranscodeCancelled:          return "TranscodeCancelled";
        case EngineError::OutputSessionUnavailable:    return "OutputSessionUnavailable";
        case EngineError::EngineStartFailed:           return "EngineStartFailed";
        case EngineError::MediaUnavailable:            return "MediaUnavailable";
        case EngineError::InvalidDuration:             return "InvalidDuration";
        case EngineError::ScheduleFailed:              return "ScheduleFailed";
    }
    return "Unknown";
}

std::string describe(const EngineResult& result) {
    std::string text = errorName(result.error);
    if (!result.detail.empty()) {
        text += ": " + result.detail;
    }
    return text;
}

const char* enginePhaseName(EnginePhase phase) {
    switch (phase) {
        case EnginePhase::Unprepared: return "Unprepared";
        case EnginePhase::Prepared:   return "Prepared";
        case EnginePhase::Loaded:     return "Loaded";
        case EnginePhase::Playing:    return "Playing";
        case EnginePhase::Stopped:    return "Stopped";
    }
    return "Unknown";
}
