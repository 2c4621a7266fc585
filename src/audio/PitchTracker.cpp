#include "../../include/audio/PitchTracker.h"
#include "../../include/audio/Autocorrelator.h"
#include "../../include/core/MathUtils.h"
#include <algorithm>
#include <cmath>

namespace dae::audio {

bool PitchTracker::initialize(const nlohmann::json& config) {
    if (config.contains("frameSec")) m_config.frameSec = config["frameSec"].get<double>();
    if (config.contains("hopSec")) m_config.hopSec = config["hopSec"].get<double>();
    if (config.contains("minRms")) m_config.minRms = config["minRms"].get<double>();
    if (config.contains("minHz")) m_config.minHz = config["minHz"].get<double>();
    if (config.contains("maxHz")) m_config.maxHz = config["maxHz"].get<double>();
    if (config.contains("minPeriodicity")) m_config.minPeriodicity = config["minPeriodicity"].get<double>();
    if (config.contains("minVoicedFrames")) m_config.minVoicedFrames = config["minVoicedFrames"].get<size_t>();
    if (config.contains("monotoneSemitones")) m_config.monotoneSemitones = config["monotoneSemitones"].get<double>();
    if (config.contains("dynamicSemitones")) m_config.dynamicSemitones = config["dynamicSemitones"].get<double>();

    return m_config.frameSec > 0.0 && m_config.hopSec > 0.0
        && m_config.minHz > 0.0 && m_config.maxHz > m_config.minHz
        && m_config.monotoneSemitones <= m_config.dynamicSemitones;
}

core::PitchLabel PitchTracker::classify(double stdSemitones) const {
    if (stdSemitones < m_config.monotoneSemitones) return core::PitchLabel::Monotone;
    if (stdSemitones < m_config.dynamicSemitones) return core::PitchLabel::SomeVariation;
    return core::PitchLabel::Dynamic;
}

/**
 * @brief Runs the frame loop. Returns false only when the numeric backend failed.
 */
bool PitchTracker::track(const core::AudioBuffer& audio, std::vector<double>& pitches) const {
    const double sr = audio.getSampleRate();
    const size_t frameSize = static_cast<size_t>(m_config.frameSec * sr);
    const size_t hopSize = std::max<size_t>(1, static_cast<size_t>(m_config.hopSec * sr));
    const size_t minLag = std::max<size_t>(1, static_cast<size_t>(sr / m_config.maxHz));
    const size_t maxLag = std::max(minLag + 1, static_cast<size_t>(sr / m_config.minHz));

    const std::vector<float> samples = audio.getMono();
    if (frameSize == 0 || samples.size() < frameSize + 1) return true;
    // The lag search needs the autocorrelation to extend past maxLag.
    if (frameSize <= maxLag) return true;

    Autocorrelator acf(frameSize);
    if (!acf.valid()) return false;

    const std::vector<double> window = core::window::hann(frameSize);
    std::vector<double> frame(frameSize);
    std::vector<double> r;

    for (size_t start = 0; start + frameSize < samples.size(); start += hopSize) {
        double frameMean = 0.0;
        for (size_t i = 0; i < frameSize; ++i) frameMean += samples[start + i];
        frameMean /= static_cast<double>(frameSize);

        double energy = 0.0;
        for (size_t i = 0; i < frameSize; ++i) {
            const double v = samples[start + i] - frameMean;
            frame[i] = v;
            energy += v * v;
        }
        if (std::sqrt(energy / static_cast<double>(frameSize)) < m_config.minRms) continue;

        for (size_t i = 0; i < frameSize; ++i) frame[i] *= window[i];
        acf.compute(frame, r);

        const double zeroLag = r[0];
        if (zeroLag <= 0.0) continue;

        size_t peakLag = minLag;
        for (size_t lag = minLag + 1; lag <= maxLag; ++lag) {
            if (r[lag] > r[peakLag]) peakLag = lag;
        }
        const double periodicity = r[peakLag] / (zeroLag + 1e-9);
        if (periodicity < m_config.minPeriodicity) continue;

        const double f0 = sr / static_cast<double>(peakLag);
        if (f0 >= m_config.minHz && f0 <= m_config.maxHz) {
            pitches.push_back(f0);
        }
    }
    return true;
}

core::Result<core::PitchResult> PitchTracker::analyze(const core::AudioBuffer& audio) const {
    const double sr = audio.getSampleRate();
    const size_t frameSize = static_cast<size_t>(m_config.frameSec * sr);
    if (sr <= 0.0 || frameSize == 0 || audio.getFrameCount() < frameSize + 1) {
        return core::Result<core::PitchResult>::degraded("Audio is too short for pitch tracking.");
    }

    std::vector<double> pitches;
    if (!track(audio, pitches)) {
        return core::Result<core::PitchResult>::degraded(
            "Numeric backend unavailable. Pitch tracking was skipped.");
    }

    core::PitchResult result;
    result.voicedFrames = pitches.size();
    if (pitches.size() < m_config.minVoicedFrames) {
        return result;
    }

    std::vector<double> logPitch;
    logPitch.reserve(pitches.size());
    for (double f : pitches) logPitch.push_back(std::log2(std::max(f, 1e-6)));
    const double stdSemitones = std::sqrt(core::variance(logPitch)) * 12.0;

    result.label = classify(stdSemitones);
    result.meanHz = core::roundTo(core::mean(pitches), 1);
    result.varianceHz = core::roundTo(core::variance(pitches), 2);
    result.stdSemitones = core::roundTo(stdSemitones, 2);
    return result;
}

} // namespace dae::audio
