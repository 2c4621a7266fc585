#ifndef DAE_SPEECH_SENTENCESPANNER_H
#define DAE_SPEECH_SENTENCESPANNER_H

#include <vector>
#include "../core/IAnalyzer.h"
#include "../core/AnalysisTypes.h"
#include "WordTimeline.h"

namespace dae::speech {

/**
 * @brief Configuration for sentence segmentation.
 */
struct SentenceSpannerConfig {
    /** @brief Inter-word silence (seconds) that starts a new sentence on its own. */
    double boundaryGapSec = 1.0;
    /** @brief Spans shorter than this (seconds) are dropped. */
    double minSpanSec = 0.4;
};

/**
 * @brief Segments a word timeline into sentence-like spans.
 *
 * A new span starts after a word ending in terminal punctuation or after a
 * long silence. Spans are clipped to the media duration when it is known.
 */
class SentenceSpanner : public core::IAnalyzer {
public:
    std::string getName() const override { return "Sentences"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override { m_config = SentenceSpannerConfig{}; }

    /**
     * @param words The normalized word timeline.
     * @param durationSeconds Media duration; spans are not clipped when <= 0.
     * @return Ordered spans, each at least minSpanSec long.
     */
    std::vector<core::SentenceSpan> spans(const WordTimeline& words, double durationSeconds) const;

    const SentenceSpannerConfig& config() const { return m_config; }

private:
    SentenceSpannerConfig m_config;
};

} // namespace dae::speech

#endif // DAE_SPEECH_SENTENCESPANNER_H
