#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace dae::core {

// ============================================================================
// Labels
// ============================================================================

enum class PitchLabel { Unknown, Monotone, SomeVariation, Dynamic };
enum class VolumeLabel { Unknown, TooQuiet, Inconsistent, Consistent };
enum class PauseQuality { Unknown, Effective, Mixed, NeedsWork };
/** @brief Shared by gesture activity and eye contact. */
enum class Level { Unknown, Low, Moderate, High };
enum class PostureLevel { Unknown, Unstable, Moderate, Stable };
enum class PaceLabel { Unknown, Slow, Good, Fast };
/** @brief Timeline marker severity. */
enum class Severity { Info, Warning, Critical };
/** @brief Non-verbal event severity. */
enum class EventSeverity { Low, Medium, High };

std::string toString(PitchLabel label);
std::string toString(VolumeLabel label);
std::string toString(PauseQuality quality);
std::string toString(Level level);
std::string toString(PostureLevel level);
std::string toString(PaceLabel label);
std::string toString(Severity severity);
std::string toString(EventSeverity severity);

// ============================================================================
// Transcript
// ============================================================================

/**
 * @brief One transcribed word with its timing, as produced by the speech-to-text collaborator.
 */
struct WordToken {
    std::string word;
    double start = 0.0;  ///< Seconds from the start of the media.
    double end = 0.0;    ///< Seconds from the start of the media.
    size_t index = 0;    ///< Position in the transcript.
};

/**
 * @brief Time range treated as one spoken sentence. Always end > start.
 */
struct SentenceSpan {
    double start = 0.0;
    double end = 0.0;

    double duration() const { return end - start; }
};

// ============================================================================
// Audio delivery
// ============================================================================

struct PitchResult {
    PitchLabel label = PitchLabel::Unknown;
    double meanHz = 0.0;
    double varianceHz = 0.0;
    double stdSemitones = 0.0;
    size_t voicedFrames = 0;

    bool isMonotone() const { return label == PitchLabel::Monotone; }
};

struct TrailingOffExample {
    double start = 0.0;
    double end = 0.0;
    double ratio = 0.0;  ///< Tail RMS / body RMS.
};

struct VolumeResult {
    VolumeLabel consistency = VolumeLabel::Unknown;
    double meanDbfs = 0.0;
    double dbfsStd = 0.0;
    bool tooQuiet = false;
    int trailingOffEvents = 0;
    double trailingOffRatio = 0.0;
    std::vector<TrailingOffExample> trailingOffExamples;  ///< Earliest first, at most 5.
};

struct PauseExample {
    double start = 0.0;
    double end = 0.0;
    double duration = 0.0;
};

struct PauseResult {
    PauseQuality quality = PauseQuality::Unknown;
    int effectivePauses = 0;
    int awkwardSilences = 0;
    std::vector<PauseExample> effectiveExamples;  ///< At most 6.
    std::vector<PauseExample> awkwardExamples;    ///< At most 6.
};

/**
 * @brief Aggregate of the three audio analyzers. Default-constructed it is the
 *        complete "unknown" shape.
 */
struct AudioDeliveryMetrics {
    PitchResult monotone;
    VolumeResult volume;
    PauseResult silence;
};

// ============================================================================
// Non-verbal
// ============================================================================

struct EventSpan {
    double start = 0.0;
    double end = 0.0;
    std::string startHms;
    std::string endHms;

    double duration() const { return end > start ? end - start : 0.0; }
};

struct NonVerbalEvent {
    double timestamp = 0.0;
    std::string timestampHms;
    std::string type;  ///< gaze_away | high_sway | low_gesture | high_gesture
    EventSeverity severity = EventSeverity::Medium;
    std::string title;
    std::string message;
};

/**
 * @brief Visual delivery aggregate. Default-constructed it is the complete
 *        "unknown" shape used whenever video analysis is unavailable.
 */
struct NonVerbalMetrics {
    double gestureEnergy = 0.0;
    Level activityLevel = Level::Unknown;
    double avgVelocity = 0.0;
    int samples = 0;
    double eyeContactScore = 0.0;
    Level eyeContactLevel = Level::Unknown;
    double eyeContactPct = 0.0;
    double postureScore = 0.0;
    PostureLevel postureLevel = PostureLevel::Unknown;
    double postureStability = 0.0;
    double swayScore = 0.0;
    std::vector<EventSpan> gazeAwayEvents;
    std::vector<EventSpan> postureEvents;
    std::vector<NonVerbalEvent> nonVerbalEvents;
};

// ============================================================================
// Speech + session
// ============================================================================

struct SpeechMetrics {
    double durationSeconds = 0.0;
    int wordCount = 0;
    std::optional<double> wordsPerMinute;
    PaceLabel paceLabel = PaceLabel::Unknown;
    int fillerWordCount = 0;
    std::vector<std::pair<std::string, int>> fillerWords;  ///< Sorted by count, descending.
    int stutterEvents = 0;
};

struct SessionMetrics {
    SpeechMetrics speech;
    AudioDeliveryMetrics audioDelivery;
    NonVerbalMetrics nonVerbal;
};

struct TimelineMarker {
    double second = 0.0;
    std::string category;
    Severity severity = Severity::Info;
    std::string message;
};

/**
 * @brief Everything one analysis job hands back to its caller.
 */
struct JobResult {
    std::vector<WordToken> words;
    double duration = 0.0;
    std::string transcript;
    SessionMetrics metrics;
    std::vector<TimelineMarker> markers;
    std::vector<std::string> summaryFeedback;
    std::vector<std::string> notes;
    nlohmann::json coaching = nlohmann::json::object();  ///< Pass-through from the coaching model.
};

} // namespace dae::core
