#include <iostream>
#include <cmath>
#include <string>
#include <vector>
#include "../include/pipeline/TimelineMarkerBuilder.h"

using dae::core::SessionMetrics;
using dae::core::TimelineMarker;

bool test_markers_baseline_when_nothing_fires() {
    SessionMetrics metrics;
    metrics.speech.durationSeconds = 10.0;
    metrics.speech.paceLabel = dae::core::PaceLabel::Good;

    auto markers = dae::pipeline::TimelineMarkerBuilder::build(metrics);
    if (markers.size() != 1) {
        std::cerr << "Expected a single baseline marker, got " << markers.size() << std::endl;
        return false;
    }
    const TimelineMarker& m = markers.front();
    return m.category == "overall" && m.severity == dae::core::Severity::Info && m.second == 5.0;
}

bool test_markers_placement_and_order() {
    SessionMetrics metrics;
    metrics.speech.durationSeconds = 20.0;
    metrics.speech.paceLabel = dae::core::PaceLabel::Fast;
    metrics.speech.fillerWords = {{"um", 4}, {"like", 2}, {"so", 1}, {"actually", 1}};
    metrics.speech.stutterEvents = 2;
    metrics.audioDelivery.monotone.label = dae::core::PitchLabel::Monotone;
    metrics.audioDelivery.volume.trailingOffRatio = 0.5;
    metrics.audioDelivery.volume.trailingOffExamples = {{3.2, 3.5, 0.4}};
    metrics.audioDelivery.silence.awkwardSilences = 1;
    metrics.audioDelivery.silence.awkwardExamples = {{6.4, 7.5, 1.1}};

    auto markers = dae::pipeline::TimelineMarkerBuilder::build(metrics);
    const std::vector<std::pair<double, std::string>> expected = {
        {3.2, "volume"}, {5.0, "pace"}, {6.4, "silence"}, {7.0, "filler_words"},
        {8.0, "tone"}, {10.6, "filler_words"}, {13.0, "fluency"}, {14.2, "filler_words"}
    };
    if (markers.size() != expected.size()) {
        std::cerr << "Expected " << expected.size() << " markers, got " << markers.size() << std::endl;
        return false;
    }
    for (size_t i = 0; i < expected.size(); ++i) {
        if (std::abs(markers[i].second - expected[i].first) > 1e-9 || markers[i].category != expected[i].second) {
            std::cerr << "Marker " << i << " is " << markers[i].category << "@" << markers[i].second << std::endl;
            return false;
        }
    }
    // Only fillers repeated at least three times are warnings.
    return markers[3].severity == dae::core::Severity::Warning
        && markers[5].severity == dae::core::Severity::Info;
}

bool test_markers_fallback_duration() {
    SessionMetrics metrics;
    metrics.speech.paceLabel = dae::core::PaceLabel::Slow;
    auto markers = dae::pipeline::TimelineMarkerBuilder::build(metrics);
    return markers.size() == 1 && markers[0].category == "pace" && markers[0].second == 7.5;
}

bool test_summary_feedback_mentions_findings() {
    SessionMetrics metrics;
    metrics.speech.paceLabel = dae::core::PaceLabel::Good;
    metrics.speech.wordsPerMinute = 142.04;
    metrics.audioDelivery.monotone.label = dae::core::PitchLabel::Dynamic;
    metrics.audioDelivery.silence.effectivePauses = 2;

    auto feedback = dae::pipeline::composeSummaryFeedback(metrics);
    if (feedback.size() != 4) {
        std::cerr << "Expected 4 feedback lines, got " << feedback.size() << std::endl;
        return false;
    }
    return feedback[0] == "Your pace is in a strong range (~142.0 WPM)."
        && feedback[1] == "Filler-word usage looks clean in this sample."
        && feedback[2] == "Vocal inflection is dynamic and helps keep attention."
        && feedback[3] == "2 effective pause(s) detected after sentence boundaries.";
}
