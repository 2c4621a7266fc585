#include "../../include/vision/NonVerbalAnalyzer.h"
#include "../../include/core/MathUtils.h"
#include <algorithm>
#include <initializer_list>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace dae::vision {

namespace {

std::string secondsText(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << seconds;
    return oss.str();
}

core::NonVerbalEvent makeEvent(double timestamp, const std::string& type, core::EventSeverity severity,
                               const std::string& title, const std::string& message) {
    core::NonVerbalEvent event;
    event.timestamp = timestamp;
    event.timestampHms = core::formatClock(timestamp);
    event.type = type;
    event.severity = severity;
    event.title = title;
    event.message = message;
    return event;
}

} // namespace

bool NonVerbalAnalyzer::initialize(const nlohmann::json& config) {
    bool ok = true;
    for (core::IAnalyzer* analyzer : std::initializer_list<core::IAnalyzer*>{
             &m_gesture, &m_attention, &m_posture}) {
        const std::string name = analyzer->getName();
        if (!config.contains(name)) continue;
        if (!analyzer->initialize(config[name])) {
            std::cerr << "[Config] Invalid settings for '" << name << "'" << std::endl;
            ok = false;
        }
    }

    if (config.contains("Events")) {
        const auto& events = config["Events"];
        if (events.contains("minGazeAwaySec")) m_events.minGazeAwaySec = events["minGazeAwaySec"].get<double>();
        if (events.contains("minSwaySec")) m_events.minSwaySec = events["minSwaySec"].get<double>();
        if (events.contains("highSeverityAfterSec")) {
            m_events.highSeverityAfterSec = events["highSeverityAfterSec"].get<double>();
        }
        if (m_events.minGazeAwaySec < 0.0 || m_events.minSwaySec < 0.0) {
            std::cerr << "[Config] Invalid settings for 'Events'" << std::endl;
            ok = false;
        }
    }
    return ok;
}

void NonVerbalAnalyzer::reset() {
    m_gesture.reset();
    m_attention.reset();
    m_posture.reset();
    m_events = EventConfig{};
}

std::vector<core::NonVerbalEvent> NonVerbalAnalyzer::buildEvents(const std::vector<core::EventSpan>& gazeAway,
                                                                 const std::vector<core::EventSpan>& sway,
                                                                 core::Level activityLevel) const {
    std::vector<core::NonVerbalEvent> events;
    auto severityFor = [this](double duration) {
        return duration >= m_events.highSeverityAfterSec ? core::EventSeverity::High
                                                         : core::EventSeverity::Medium;
    };

    for (const auto& span : gazeAway) {
        const double duration = span.duration();
        events.push_back(makeEvent(span.start, "gaze_away", severityFor(duration),
                                   "Eye contact dropped",
                                   "Looked away for ~" + secondsText(duration) + "s."));
    }
    for (const auto& span : sway) {
        const double duration = span.duration();
        events.push_back(makeEvent(span.start, "high_sway", severityFor(duration),
                                   "Posture became unstable",
                                   "Noticeable upper-body sway for ~" + secondsText(duration) + "s."));
    }

    if (activityLevel == core::Level::Low) {
        events.push_back(makeEvent(0.0, "low_gesture", core::EventSeverity::Low,
                                   "Low gesture activity",
                                   "Consider using a few deliberate hand gestures for emphasis."));
    } else if (activityLevel == core::Level::High) {
        events.push_back(makeEvent(0.0, "high_gesture", core::EventSeverity::Medium,
                                   "High gesture activity",
                                   "Energetic movement detected; keep gestures intentional."));
    }

    std::stable_sort(events.begin(), events.end(),
                     [](const core::NonVerbalEvent& a, const core::NonVerbalEvent& b) {
                         return a.timestamp < b.timestamp;
                     });
    return events;
}

core::NonVerbalMetrics NonVerbalAnalyzer::analyze(const std::vector<LandmarkFrame>& frames) const {
    core::NonVerbalMetrics metrics;
    metrics.samples = static_cast<int>(frames.size());

    const GestureResult gesture = m_gesture.analyze(frames);
    metrics.gestureEnergy = gesture.gestureEnergy;
    metrics.activityLevel = gesture.activityLevel;
    metrics.avgVelocity = gesture.avgVelocity;

    const AttentionResult attention = m_attention.analyze(frames);
    metrics.eyeContactScore = attention.eyeContactScore;
    metrics.eyeContactLevel = attention.eyeContactLevel;
    metrics.eyeContactPct = attention.eyeContactPct;
    metrics.gazeAwayEvents = segmentEvents(invert(attention.attentive), m_events.minGazeAwaySec);

    const PostureResult posture = m_posture.analyze(frames);
    metrics.postureStability = posture.postureStability;
    metrics.postureScore = posture.postureStability;
    metrics.postureLevel = posture.postureLevel;
    metrics.swayScore = posture.swayScore;
    metrics.postureEvents = segmentEvents(posture.highSway, m_events.minSwaySec);

    metrics.nonVerbalEvents = buildEvents(metrics.gazeAwayEvents, metrics.postureEvents,
                                          metrics.activityLevel);
    return metrics;
}

NonVerbalReport NonVerbalAnalyzer::analyzeVideo(ILandmarkProvider& provider,
                                                const std::string& videoPath,
                                                int targetFps) const {
    NonVerbalReport report;
    try {
        auto frames = provider.extract(videoPath, targetFps);
        if (!frames) {
            report.notes.push_back("Non-verbal analysis skipped: " + frames.reason());
            return report;
        }
        report.metrics = analyze(frames.value());
    } catch (const std::exception& e) {
        report.metrics = core::NonVerbalMetrics{};
        report.notes.push_back(std::string("Non-verbal analysis failed: ") + e.what());
    }
    return report;
}

} // namespace dae::vision
