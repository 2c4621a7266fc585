#ifndef DAE_SPEECH_SPEECHMETRICS_H
#define DAE_SPEECH_SPEECHMETRICS_H

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../core/AnalysisTypes.h"

namespace dae::speech {

/** @brief Words per minute below which pace is "slow". */
constexpr double kPaceSlowWpm = 110.0;
/** @brief Words per minute above which pace is "fast". */
constexpr double kPaceFastWpm = 170.0;

/**
 * @brief Lowercased word tokens (letters, digits, underscore, apostrophe).
 *
 * Input is UTF-8. Non-ASCII letters (é, ï, ß, ...) belong to the word; Unicode
 * punctuation such as curly quotes and dashes separates words.
 */
std::vector<std::string> tokenize(const std::string& text);

/**
 * @brief Counts filler words and the "you know" phrase.
 * @return (filler, count) pairs sorted by count descending; ties keep first-seen order.
 */
std::vector<std::pair<std::string, int>> countFillerWords(const std::string& text);

/**
 * @brief Number of immediately repeated tokens ("I I think").
 */
int countStutterEvents(const std::vector<std::string>& tokens);

core::PaceLabel classifyPace(std::optional<double> wpm);

/**
 * @brief Transcript-level pacing and fluency metrics.
 * @param transcript The full transcript text.
 * @param durationSeconds Media duration; WPM is absent when not positive.
 */
core::SpeechMetrics buildSpeechMetrics(const std::string& transcript, double durationSeconds);

} // namespace dae::speech

#endif // DAE_SPEECH_SPEECHMETRICS_H
