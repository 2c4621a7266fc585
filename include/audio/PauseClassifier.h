#ifndef DAE_AUDIO_PAUSECLASSIFIER_H
#define DAE_AUDIO_PAUSECLASSIFIER_H

#include "../core/IAnalyzer.h"
#include "../core/AnalysisTypes.h"
#include "../speech/WordTimeline.h"

namespace dae::audio {

struct PauseConfig {
    double minGapSec = 0.25;            ///< Shorter gaps are ordinary word spacing.
    double boundaryGapSec = 0.95;       ///< A gap this long counts as a sentence boundary by itself.
    double effectiveMinSec = 0.35;      ///< Boundary pause range considered rhetorical...
    double effectiveMaxSec = 1.4;       ///< ...inclusive on both ends.
    double awkwardMidSentenceSec = 0.7; ///< Mid-sentence gap at or above this is awkward.
    double awkwardBoundarySec = 1.8;    ///< Boundary gap above this is awkward.
    size_t maxExamples = 6;
};

/**
 * @brief Classifies inter-word silences into effective pauses and awkward silences.
 *
 * Works on word timing alone, so it runs even when raw audio is unavailable.
 */
class PauseClassifier : public core::IAnalyzer {
public:
    std::string getName() const override { return "Pause"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override { m_config = PauseConfig{}; }

    core::PauseResult analyze(const speech::WordTimeline& words) const;

    const PauseConfig& config() const { return m_config; }

private:
    PauseConfig m_config;
};

} // namespace dae::audio

#endif // DAE_AUDIO_PAUSECLASSIFIER_H
