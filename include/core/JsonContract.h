#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>
#include "AnalysisTypes.h"

namespace dae::core {

/**
 * @brief Manages the JSON contract for analysis output.
 *
 * This class handles versioning, structure creation and validation of the
 * report written for one analysis job. Every aggregate is emitted with all
 * of its keys, whatever the job managed to measure.
 */
class JsonContract {
public:
    /** @brief The current version number of the JSON contract schema. */
    static constexpr int CURRENT_VERSION = 1;

    /**
     * @brief Creates the final structured JSON report for a finished job.
     *
     * Coaching keys (scores, strengths, improvements, structure, feedbackEvents,
     * stats) are taken from the coaching pass-through when present and default
     * to empty values otherwise. stats falls back to figures from the speech metrics.
     *
     * @param result The job's complete result bundle.
     * @param analysisId An optional, unique ID for the analysis. If empty, one will be generated.
     * @return The final, structured JSON analysis report.
     */
    static nlohmann::json createOutput(const JobResult& result, const std::string& analysisId = "") {
        nlohmann::json output = header("done", analysisId);

        nlohmann::json words = nlohmann::json::array();
        for (const auto& w : result.words) words.push_back(toJson(w));

        nlohmann::json metrics = toJson(result.metrics.speech);
        metrics["audio_delivery"] = toJson(result.metrics.audioDelivery);
        metrics["non_verbal"] = toJson(result.metrics.nonVerbal);

        nlohmann::json markers = nlohmann::json::array();
        for (const auto& m : result.markers) markers.push_back(toJson(m));

        output["words"] = words;
        output["duration"] = result.duration;
        output["transcript"] = result.transcript;
        output["metrics"] = metrics;
        output["non_verbal"] = metrics["non_verbal"];
        output["markers"] = markers;
        output["summary_feedback"] = result.summaryFeedback;
        output["notes"] = result.notes;

        const nlohmann::json& coaching = result.coaching.is_object() ? result.coaching : emptyObject();
        output["coaching"] = coaching;
        output["scores"] = coaching.value("scores", nlohmann::json::object());
        output["strengths"] = coaching.value("strengths", nlohmann::json::array());
        output["improvements"] = coaching.value("improvements", nlohmann::json::array());
        output["structure"] = coaching.value("structure", nlohmann::json::object());
        output["feedbackEvents"] = coaching.value("feedbackEvents", nlohmann::json::array());
        output["stats"] = coaching.contains("stats") ? coaching["stats"] : defaultStats(result.metrics.speech);

        return output;
    }

    /**
     * @brief Creates the report for a job that ended in the error state.
     * @param message The fault message, verbatim.
     * @param analysisId An optional, unique ID for the analysis.
     */
    static nlohmann::json createErrorOutput(const std::string& message, const std::string& analysisId = "") {
        nlohmann::json output = header("error", analysisId);
        output["error_message"] = message;
        return output;
    }

    /**
     * @brief Validates the given JSON against a specified contract version.
     *
     * Checks the metadata fields, then the fields required by the job status:
     * a finished report must carry metrics with both delivery aggregates,
     * markers and notes; an error report must carry its message.
     * @param json The JSON object to validate.
     * @param version The schema version to validate against (defaults to CURRENT_VERSION).
     * @return true if the JSON contains the required fields for the specified version, false otherwise.
     */
    static bool validate(const nlohmann::json& json, int version = CURRENT_VERSION) {
        if (!json.is_object() || !json.contains("version") || json["version"] != version) {
            return false;
        }

        if (version != 1) return false;
        if (!json.contains("timestamp") || !json.contains("analysisId") || !json.contains("status")) {
            return false;
        }

        const std::string status = json["status"].is_string() ? json["status"].get<std::string>() : "";
        if (status == "error") {
            return json.contains("error_message");
        }
        if (status != "done") return false;

        if (!json.contains("metrics") || !json["metrics"].is_object()) return false;
        const auto& metrics = json["metrics"];
        if (!metrics.contains("audio_delivery") || !metrics.contains("non_verbal")) return false;
        for (const char* key : {"monotone", "volume", "silence"}) {
            if (!metrics["audio_delivery"].contains(key)) return false;
        }
        return json.contains("markers") && json["markers"].is_array() && !json["markers"].empty() &&
               json.contains("notes") && json["notes"].is_array();
    }

    // ------------------------------------------------------------------------
    // Aggregate serialization
    // ------------------------------------------------------------------------

    static nlohmann::json toJson(const WordToken& word) {
        return {{"word", word.word}, {"start", word.start}, {"end", word.end}, {"index", word.index}};
    }

    static nlohmann::json toJson(const SpeechMetrics& speech) {
        nlohmann::json fillers = nlohmann::json::array();
        for (const auto& [word, count] : speech.fillerWords) {
            fillers.push_back({{"word", word}, {"count", count}});
        }
        return {
            {"duration_seconds", speech.durationSeconds},
            {"word_count", speech.wordCount},
            {"words_per_minute", speech.wordsPerMinute ? nlohmann::json(*speech.wordsPerMinute) : nlohmann::json()},
            {"pace_label", toString(speech.paceLabel)},
            {"filler_word_count", speech.fillerWordCount},
            {"filler_words", fillers},
            {"stutter_events", speech.stutterEvents}
        };
    }

    static nlohmann::json toJson(const AudioDeliveryMetrics& audio) {
        const PitchResult& pitch = audio.monotone;
        const VolumeResult& volume = audio.volume;
        const PauseResult& pauses = audio.silence;

        nlohmann::json trailing = nlohmann::json::array();
        for (const auto& ex : volume.trailingOffExamples) {
            trailing.push_back({{"start", ex.start}, {"end", ex.end}, {"ratio", ex.ratio}});
        }

        return {
            {"monotone", {
                {"label", toString(pitch.label)},
                {"is_monotone", pitch.isMonotone()},
                {"mean_pitch_hz", pitch.meanHz},
                {"pitch_variance_hz", pitch.varianceHz},
                {"pitch_std_semitones", pitch.stdSemitones},
                {"voiced_frames", pitch.voicedFrames}
            }},
            {"volume", {
                {"consistency_label", toString(volume.consistency)},
                {"mean_dbfs", volume.meanDbfs},
                {"dbfs_std", volume.dbfsStd},
                {"too_quiet", volume.tooQuiet},
                {"trailing_off_events", volume.trailingOffEvents},
                {"trailing_off_ratio", volume.trailingOffRatio},
                {"trailing_off_examples", trailing}
            }},
            {"silence", {
                {"pause_quality", toString(pauses.quality)},
                {"effective_pauses", pauses.effectivePauses},
                {"awkward_silences", pauses.awkwardSilences},
                {"effective_examples", toJson(pauses.effectiveExamples)},
                {"awkward_examples", toJson(pauses.awkwardExamples)}
            }}
        };
    }

    static nlohmann::json toJson(const std::vector<PauseExample>& examples) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& ex : examples) {
            out.push_back({{"start", ex.start}, {"end", ex.end}, {"duration", ex.duration}});
        }
        return out;
    }

    static nlohmann::json toJson(const std::vector<EventSpan>& spans) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& s : spans) {
            out.push_back({{"start", s.start}, {"end", s.end}, {"start_hms", s.startHms}, {"end_hms", s.endHms}});
        }
        return out;
    }

    static nlohmann::json toJson(const NonVerbalMetrics& nv) {
        nlohmann::json events = nlohmann::json::array();
        for (const auto& e : nv.nonVerbalEvents) {
            events.push_back({
                {"timestamp", e.timestamp},
                {"timestamp_hms", e.timestampHms},
                {"type", e.type},
                {"severity", toString(e.severity)},
                {"title", e.title},
                {"message", e.message}
            });
        }
        return {
            {"gesture_energy", nv.gestureEnergy},
            {"activity_level", toString(nv.activityLevel)},
            {"avg_velocity", nv.avgVelocity},
            {"samples", nv.samples},
            {"eye_contact_score", nv.eyeContactScore},
            {"eye_contact_level", toString(nv.eyeContactLevel)},
            {"eye_contact_pct", nv.eyeContactPct},
            {"posture_score", nv.postureScore},
            {"posture_level", toString(nv.postureLevel)},
            {"posture_stability", nv.postureStability},
            {"sway_score", nv.swayScore},
            {"gaze_away_events", toJson(nv.gazeAwayEvents)},
            {"posture_events", toJson(nv.postureEvents)},
            {"non_verbal_events", events}
        };
    }

    static nlohmann::json toJson(const TimelineMarker& marker) {
        return {
            {"second", marker.second},
            {"category", marker.category},
            {"severity", toString(marker.severity)},
            {"message", marker.message}
        };
    }

private:
    static nlohmann::json header(const std::string& status, const std::string& analysisId) {
        nlohmann::json output;
        output["version"] = CURRENT_VERSION;
        output["timestamp"] = getCurrentTimestamp();
        output["analysisId"] = analysisId.empty() ? generateId() : analysisId;
        output["status"] = status;
        return output;
    }

    static const nlohmann::json& emptyObject() {
        static const nlohmann::json kEmpty = nlohmann::json::object();
        return kEmpty;
    }

    static nlohmann::json defaultStats(const SpeechMetrics& speech) {
        return {
            {"total_filler_words", speech.fillerWordCount},
            {"avg_wpm", speech.wordsPerMinute.value_or(0.0)},
            {"total_words", speech.wordCount},
            {"flagged_sentences", 0}
        };
    }

    /**
     * @brief Generates the current time as an ISO 8601 formatted string (UTC).
     * @return A timestamp string in "YYYY-MM-DDTHH:MM:SSZ" format.
     */
    static std::string getCurrentTimestamp() {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Generates a simple unique analysis ID based on the current time in milliseconds.
     */
    static std::string generateId() {
        auto now = std::chrono::steady_clock::now();
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count();
        return "analysis_" + std::to_string(millis);
    }
};

} // namespace dae::core
