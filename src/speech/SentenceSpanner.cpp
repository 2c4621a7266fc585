#include "../../include/speech/SentenceSpanner.h"
#include <algorithm>
#include <utility>

namespace dae::speech {

bool SentenceSpanner::initialize(const nlohmann::json& config) {
    if (config.contains("boundaryGapSec")) m_config.boundaryGapSec = config["boundaryGapSec"].get<double>();
    if (config.contains("minSpanSec")) m_config.minSpanSec = config["minSpanSec"].get<double>();
    return m_config.boundaryGapSec > 0.0 && m_config.minSpanSec > 0.0;
}

std::vector<core::SentenceSpan> SentenceSpanner::spans(const WordTimeline& words,
                                                       double durationSeconds) const {
    if (words.empty()) return {};

    std::vector<std::pair<double, double>> raw;
    double spanStart = words[0].start;
    double prevEnd = words[0].end;

    for (size_t i = 1; i < words.size(); ++i) {
        const double currentStart = words[i].start;
        const double gap = std::max(0.0, currentStart - prevEnd);
        if (endsSentence(words[i - 1].word) || gap >= m_config.boundaryGapSec) {
            raw.emplace_back(spanStart, prevEnd);
            spanStart = currentStart;
        }
        // Overlapping tokens must not shrink the running span end.
        prevEnd = std::max(prevEnd, words[i].end);
    }
    raw.emplace_back(spanStart, prevEnd);

    std::vector<core::SentenceSpan> cleaned;
    const double clipEnd = std::max(0.0, durationSeconds);
    for (const auto& [start, end] : raw) {
        const double s = std::max(0.0, start);
        double e = std::max(s, end);
        if (clipEnd > 0.0) e = std::min(e, clipEnd);
        if (e - s >= m_config.minSpanSec) {
            cleaned.push_back({s, e});
        }
    }
    return cleaned;
}

} // namespace dae::speech
