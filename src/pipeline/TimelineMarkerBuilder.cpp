#include "../../include/pipeline/TimelineMarkerBuilder.h"
#include "../../include/core/MathUtils.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace dae::pipeline {

namespace {

constexpr double kTrailingRatioFlag = 0.35;

std::string wpmText(const std::optional<double>& wpm) {
    if (!wpm) return "n/a";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << *wpm;
    return oss.str();
}

} // namespace

void TimelineMarkerBuilder::add(std::vector<core::TimelineMarker>& markers, double second,
                                const std::string& category, core::Severity severity,
                                const std::string& message) {
    core::TimelineMarker marker;
    marker.second = core::roundTo(std::max(0.0, second), 2);
    marker.category = category;
    marker.severity = severity;
    marker.message = message;
    markers.push_back(std::move(marker));
}

std::vector<core::TimelineMarker> TimelineMarkerBuilder::build(const core::SessionMetrics& metrics) {
    const core::SpeechMetrics& speech = metrics.speech;
    const core::AudioDeliveryMetrics& audio = metrics.audioDelivery;
    const double duration = speech.durationSeconds > 0.0 ? speech.durationSeconds : kFallbackDurationSec;

    std::vector<core::TimelineMarker> markers;

    if (speech.paceLabel == core::PaceLabel::Fast) {
        add(markers, duration * 0.25, "pace", core::Severity::Warning,
            "Pace is fast here. Add short pauses to improve clarity.");
    } else if (speech.paceLabel == core::PaceLabel::Slow) {
        add(markers, duration * 0.25, "pace", core::Severity::Warning,
            "Pace is slow here. Tighten sentence openings and transitions.");
    }

    const size_t fillerMarkers = std::min(kMaxFillerMarkers, speech.fillerWords.size());
    for (size_t i = 0; i < fillerMarkers; ++i) {
        const auto& [word, count] = speech.fillerWords[i];
        add(markers, duration * (0.35 + static_cast<double>(i) * 0.18), "filler_words",
            count >= 3 ? core::Severity::Warning : core::Severity::Info,
            "Filler word \"" + word + "\" appears often (" + std::to_string(count) + " times).");
    }

    if (speech.stutterEvents > 0) {
        add(markers, duration * 0.65, "fluency", core::Severity::Warning,
            "Repeated-word stutters detected (" + std::to_string(speech.stutterEvents) + ").");
    }

    if (audio.monotone.label == core::PitchLabel::Monotone) {
        add(markers, duration * 0.4, "tone", core::Severity::Warning,
            "Low pitch variation detected. Add more vocal inflection on key points.");
    }

    const double trailingAt = audio.volume.trailingOffExamples.empty()
        ? duration * 0.75
        : audio.volume.trailingOffExamples.front().start;
    if (audio.volume.tooQuiet) {
        add(markers, trailingAt, "volume", core::Severity::Warning,
            "Overall volume is low. Project your voice more consistently.");
    } else if (audio.volume.trailingOffRatio >= kTrailingRatioFlag) {
        add(markers, trailingAt, "volume", core::Severity::Warning,
            "You tend to trail off at sentence endings. Maintain volume through the final word.");
    }

    if (audio.silence.awkwardSilences > 0) {
        const double awkwardAt = audio.silence.awkwardExamples.empty()
            ? duration * 0.55
            : audio.silence.awkwardExamples.front().start;
        add(markers, awkwardAt, "silence", core::Severity::Warning,
            "Awkward mid-sentence silence detected. Pause after complete thoughts instead.");
    }

    if (markers.empty()) {
        add(markers, duration * 0.5, "overall", core::Severity::Info,
            "Great baseline delivery. Keep practicing for consistency.");
    }

    std::stable_sort(markers.begin(), markers.end(),
                     [](const core::TimelineMarker& a, const core::TimelineMarker& b) {
                         return a.second < b.second;
                     });
    return markers;
}

std::vector<std::string> composeSummaryFeedback(const core::SessionMetrics& metrics) {
    const core::SpeechMetrics& speech = metrics.speech;
    const core::AudioDeliveryMetrics& audio = metrics.audioDelivery;
    std::vector<std::string> feedback;

    const std::string wpm = wpmText(speech.wordsPerMinute);
    switch (speech.paceLabel) {
        case core::PaceLabel::Fast:
            feedback.push_back("You are speaking quickly (~" + wpm +
                               " WPM). Aim for 120-160 WPM and pause at key points.");
            break;
        case core::PaceLabel::Slow:
            feedback.push_back("You are speaking slowly (~" + wpm +
                               " WPM). Try shorter phrases and more vocal energy.");
            break;
        case core::PaceLabel::Good:
            feedback.push_back("Your pace is in a strong range (~" + wpm + " WPM).");
            break;
        case core::PaceLabel::Unknown:
            break;
    }

    if (speech.fillerWordCount >= 6) {
        feedback.emplace_back("High filler-word usage detected. Replace fillers with short silent pauses.");
    } else if (speech.fillerWordCount > 0) {
        feedback.emplace_back("Some filler words detected. Practice intentional pauses before key points.");
    } else {
        feedback.emplace_back("Filler-word usage looks clean in this sample.");
    }

    if (speech.stutterEvents > 0) {
        feedback.emplace_back("Minor stutter patterns detected. Slow down sentence starts and breathe between points.");
    }

    if (audio.monotone.label == core::PitchLabel::Monotone) {
        feedback.emplace_back("Your pitch variation is limited. Emphasize key words with intentional inflection.");
    } else if (audio.monotone.label == core::PitchLabel::Dynamic) {
        feedback.emplace_back("Vocal inflection is dynamic and helps keep attention.");
    }

    if (audio.volume.tooQuiet) {
        feedback.emplace_back("Overall volume is quiet. Increase projection so every sentence lands clearly.");
    } else if (audio.volume.trailingOffRatio >= kTrailingRatioFlag) {
        feedback.emplace_back("You trail off at sentence endings. Keep your volume steady through the final phrase.");
    }

    if (audio.silence.awkwardSilences > 0) {
        feedback.push_back(std::to_string(audio.silence.awkwardSilences) +
                           " awkward mid-sentence silence(s) detected. Pause after complete thoughts.");
    } else if (audio.silence.effectivePauses > 0) {
        feedback.push_back(std::to_string(audio.silence.effectivePauses) +
                           " effective pause(s) detected after sentence boundaries.");
    }

    return feedback;
}

} // namespace dae::pipeline
