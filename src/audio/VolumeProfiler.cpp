#include "../../include/audio/VolumeProfiler.h"
#include "../../include/core/MathUtils.h"
#include <algorithm>
#include <cmath>

namespace dae::audio {

bool VolumeProfiler::initialize(const nlohmann::json& config) {
    if (config.contains("frameSec")) m_config.frameSec = config["frameSec"].get<double>();
    if (config.contains("hopSec")) m_config.hopSec = config["hopSec"].get<double>();
    if (config.contains("tooQuietDbfs")) m_config.tooQuietDbfs = config["tooQuietDbfs"].get<double>();
    if (config.contains("minSentenceSec")) m_config.minSentenceSec = config["minSentenceSec"].get<double>();
    if (config.contains("tailMaxSec")) m_config.tailMaxSec = config["tailMaxSec"].get<double>();
    if (config.contains("tailMaxFraction")) m_config.tailMaxFraction = config["tailMaxFraction"].get<double>();
    if (config.contains("trailingRatio")) m_config.trailingRatio = config["trailingRatio"].get<double>();
    if (config.contains("inconsistentTrailing")) m_config.inconsistentTrailing = config["inconsistentTrailing"].get<double>();
    if (config.contains("inconsistentStdDb")) m_config.inconsistentStdDb = config["inconsistentStdDb"].get<double>();
    if (config.contains("maxExamples")) m_config.maxExamples = config["maxExamples"].get<size_t>();

    return m_config.frameSec > 0.0 && m_config.hopSec > 0.0
        && m_config.tailMaxFraction > 0.0 && m_config.tailMaxFraction < 1.0;
}

std::vector<double> VolumeProfiler::levels(const core::AudioBuffer& audio) const {
    const double sr = audio.getSampleRate();
    const size_t frameSize = std::max<size_t>(1, static_cast<size_t>(m_config.frameSec * sr));
    const size_t hopSize = std::max<size_t>(1, static_cast<size_t>(m_config.hopSec * sr));
    const std::vector<float> samples = audio.getMono();

    std::vector<double> db;
    for (size_t start = 0; start + frameSize < samples.size(); start += hopSize) {
        db.push_back(core::frame::toDbfs(core::frame::rms(samples.data(), start, start + frameSize)));
    }
    return db;
}

core::Result<core::VolumeResult> VolumeProfiler::analyze(const core::AudioBuffer& audio,
                                                         const std::vector<core::SentenceSpan>& spans) const {
    const std::vector<double> db = levels(audio);
    if (db.empty()) {
        return core::Result<core::VolumeResult>::degraded("Audio is too short for volume profiling.");
    }

    const double meanDbfs = core::mean(db);
    const double dbfsStd = std::sqrt(core::variance(db));
    const bool tooQuiet = meanDbfs < m_config.tooQuietDbfs;

    const double sr = audio.getSampleRate();
    const std::vector<float> samples = audio.getMono();
    std::vector<core::TrailingOffExample> trailing;

    for (const auto& span : spans) {
        const double spanDur = span.duration();
        if (spanDur < m_config.minSentenceSec) continue;

        const size_t startIdx = std::min(samples.size(), static_cast<size_t>(span.start * sr));
        const size_t endIdx = std::min(samples.size(), static_cast<size_t>(span.end * sr));
        if (endIdx <= startIdx + 10) continue;

        const double tailSec = std::min(m_config.tailMaxSec, spanDur * m_config.tailMaxFraction);
        const size_t tailLen = static_cast<size_t>(tailSec * sr);
        const size_t segLen = endIdx - startIdx;
        if (tailLen <= 10 || tailLen >= segLen) continue;

        const size_t tailStart = endIdx - tailLen;
        const double bodyRms = core::frame::rms(samples.data(), startIdx, tailStart);
        const double tailRms = core::frame::rms(samples.data(), tailStart, endIdx);
        if (bodyRms <= 1e-7) continue;

        const double ratio = tailRms / bodyRms;
        if (ratio < m_config.trailingRatio) {
            trailing.push_back({
                core::roundTo(std::max(span.start, span.end - tailSec), 2),
                core::roundTo(span.end, 2),
                core::roundTo(ratio, 2)
            });
        }
    }

    core::VolumeResult result;
    result.meanDbfs = core::roundTo(meanDbfs, 2);
    result.dbfsStd = core::roundTo(dbfsStd, 2);
    result.tooQuiet = tooQuiet;
    result.trailingOffEvents = static_cast<int>(trailing.size());
    const double trailingRatio = spans.empty()
        ? 0.0
        : static_cast<double>(trailing.size()) / static_cast<double>(spans.size());
    result.trailingOffRatio = core::roundTo(trailingRatio, 2);

    if (tooQuiet) {
        result.consistency = core::VolumeLabel::TooQuiet;
    } else if (trailingRatio >= m_config.inconsistentTrailing || dbfsStd > m_config.inconsistentStdDb) {
        result.consistency = core::VolumeLabel::Inconsistent;
    } else {
        result.consistency = core::VolumeLabel::Consistent;
    }

    if (trailing.size() > m_config.maxExamples) trailing.resize(m_config.maxExamples);
    result.trailingOffExamples = std::move(trailing);
    return result;
}

} // namespace dae::audio
