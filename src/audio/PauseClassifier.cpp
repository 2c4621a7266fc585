#include "../../include/audio/PauseClassifier.h"
#include "../../include/core/MathUtils.h"
#include <algorithm>

namespace dae::audio {

bool PauseClassifier::initialize(const nlohmann::json& config) {
    if (config.contains("minGapSec")) m_config.minGapSec = config["minGapSec"].get<double>();
    if (config.contains("boundaryGapSec")) m_config.boundaryGapSec = config["boundaryGapSec"].get<double>();
    if (config.contains("effectiveMinSec")) m_config.effectiveMinSec = config["effectiveMinSec"].get<double>();
    if (config.contains("effectiveMaxSec")) m_config.effectiveMaxSec = config["effectiveMaxSec"].get<double>();
    if (config.contains("awkwardMidSentenceSec")) m_config.awkwardMidSentenceSec = config["awkwardMidSentenceSec"].get<double>();
    if (config.contains("awkwardBoundarySec")) m_config.awkwardBoundarySec = config["awkwardBoundarySec"].get<double>();
    if (config.contains("maxExamples")) m_config.maxExamples = config["maxExamples"].get<size_t>();
    return m_config.effectiveMinSec <= m_config.effectiveMaxSec;
}

core::PauseResult PauseClassifier::analyze(const speech::WordTimeline& words) const {
    core::PauseResult result;
    if (words.size() < 2) return result;

    std::vector<core::PauseExample> effective;
    std::vector<core::PauseExample> awkward;

    for (size_t i = 1; i < words.size(); ++i) {
        const auto& previous = words[i - 1];
        const double gap = words.gapAfter(i - 1);
        if (gap < m_config.minGapSec) continue;

        const bool afterBoundary = speech::endsSentence(previous.word) || gap >= m_config.boundaryGapSec;
        const core::PauseExample sample{
            core::roundTo(previous.end, 2),
            core::roundTo(words[i].start, 2),
            core::roundTo(gap, 2)
        };

        if (afterBoundary && gap >= m_config.effectiveMinSec && gap <= m_config.effectiveMaxSec) {
            effective.push_back(sample);
            continue;
        }
        if ((!afterBoundary && gap >= m_config.awkwardMidSentenceSec)
            || (afterBoundary && gap > m_config.awkwardBoundarySec)) {
            awkward.push_back(sample);
        }
    }

    if (!awkward.empty() && awkward.size() >= effective.size()) {
        result.quality = core::PauseQuality::NeedsWork;
    } else if (!effective.empty() && awkward.empty()) {
        result.quality = core::PauseQuality::Effective;
    } else if (!effective.empty() || !awkward.empty()) {
        result.quality = core::PauseQuality::Mixed;
    }

    result.effectivePauses = static_cast<int>(effective.size());
    result.awkwardSilences = static_cast<int>(awkward.size());
    if (effective.size() > m_config.maxExamples) effective.resize(m_config.maxExamples);
    if (awkward.size() > m_config.maxExamples) awkward.resize(m_config.maxExamples);
    result.effectiveExamples = std::move(effective);
    result.awkwardExamples = std::move(awkward);
    return result;
}

} // namespace dae::audio
