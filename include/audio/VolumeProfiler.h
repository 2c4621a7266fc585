#ifndef DAE_AUDIO_VOLUMEPROFILER_H
#define DAE_AUDIO_VOLUMEPROFILER_H

#include <vector>
#include "../core/IAnalyzer.h"
#include "../core/AudioBuffer.h"
#include "../core/AnalysisTypes.h"
#include "../core/Result.h"

namespace dae::audio {

struct VolumeConfig {
    double frameSec = 0.050;
    double hopSec = 0.025;
    double tooQuietDbfs = -33.0;       ///< Mean level below this is "too quiet".
    double minSentenceSec = 0.9;       ///< Shorter spans are not checked for trailing off.
    double tailMaxSec = 0.35;          ///< Tail length cap.
    double tailMaxFraction = 0.35;     ///< Tail length cap as a fraction of the span.
    double trailingRatio = 0.62;       ///< Tail/body RMS below this is a trailing-off event.
    double inconsistentTrailing = 0.35;///< Share of trailing spans that makes delivery inconsistent.
    double inconsistentStdDb = 7.5;    ///< dBFS spread that makes delivery inconsistent.
    size_t maxExamples = 5;
};

/**
 * @brief Frame-wise loudness profile (dBFS) and per-sentence trailing-off detection.
 */
class VolumeProfiler : public core::IAnalyzer {
public:
    std::string getName() const override { return "Volume"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override { m_config = VolumeConfig{}; }

    /**
     * @brief Per-frame dBFS levels; empty if the buffer is shorter than one frame.
     */
    std::vector<double> levels(const core::AudioBuffer& audio) const;

    /**
     * @brief Measures loudness and trailing off against the given sentence spans.
     *
     * Degrades when the buffer holds no complete frame.
     */
    core::Result<core::VolumeResult> analyze(const core::AudioBuffer& audio,
                                             const std::vector<core::SentenceSpan>& spans) const;

    const VolumeConfig& config() const { return m_config; }

private:
    VolumeConfig m_config;
};

} // namespace dae::audio

#endif // DAE_AUDIO_VOLUMEPROFILER_H
