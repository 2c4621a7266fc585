#include "../../include/core/AnalysisTypes.h"

namespace dae::core {

std::string toString(PitchLabel label) {
    switch (label) {
        case PitchLabel::Monotone: return "monotone";
        case PitchLabel::SomeVariation: return "some_variation";
        case PitchLabel::Dynamic: return "dynamic";
        case PitchLabel::Unknown: break;
    }
    return "unknown";
}

std::string toString(VolumeLabel label) {
    switch (label) {
        case VolumeLabel::TooQuiet: return "too_quiet";
        case VolumeLabel::Inconsistent: return "inconsistent";
        case VolumeLabel::Consistent: return "consistent";
        case VolumeLabel::Unknown: break;
    }
    return "unknown";
}

std::string toString(PauseQuality quality) {
    switch (quality) {
        case PauseQuality::Effective: return "effective";
        case PauseQuality::Mixed: return "mixed";
        case PauseQuality::NeedsWork: return "needs_work";
        case PauseQuality::Unknown: break;
    }
    return "unknown";
}

std::string toString(Level level) {
    switch (level) {
        case Level::Low: return "low";
        case Level::Moderate: return "moderate";
        case Level::High: return "high";
        case Level::Unknown: break;
    }
    return "unknown";
}

std::string toString(PostureLevel level) {
    switch (level) {
        case PostureLevel::Unstable: return "unstable";
        case PostureLevel::Moderate: return "moderate";
        case PostureLevel::Stable: return "stable";
        case PostureLevel::Unknown: break;
    }
    return "unknown";
}

std::string toString(PaceLabel label) {
    switch (label) {
        case PaceLabel::Slow: return "slow";
        case PaceLabel::Good: return "good";
        case PaceLabel::Fast: return "fast";
        case PaceLabel::Unknown: break;
    }
    return "unknown";
}

std::string toString(Severity severity) {
    switch (severity) {
        case Severity::Warning: return "warning";
        case Severity::Critical: return "critical";
        case Severity::Info: break;
    }
    return "info";
}

std::string toString(EventSeverity severity) {
    switch (severity) {
        case EventSeverity::Low: return "low";
        case EventSeverity::High: return "high";
        case EventSeverity::Medium: break;
    }
    return "medium";
}

} // namespace dae::core
