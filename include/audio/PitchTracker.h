#ifndef DAE_AUDIO_PITCHTRACKER_H
#define DAE_AUDIO_PITCHTRACKER_H

#include <vector>
#include "../core/IAnalyzer.h"
#include "../core/AudioBuffer.h"
#include "../core/AnalysisTypes.h"
#include "../core/Result.h"

namespace dae::audio {

/**
 * @brief Configuration for the pitch tracker.
 */
struct PitchConfig {
    double frameSec = 0.040;        ///< Analysis frame length.
    double hopSec = 0.020;          ///< Frame advance.
    double minRms = 0.008;          ///< Frames quieter than this are unvoiced.
    double minHz = 75.0;            ///< Lowest plausible speaking F0.
    double maxHz = 320.0;           ///< Highest plausible speaking F0.
    double minPeriodicity = 0.30;   ///< Peak / zero-lag autocorrelation needed to accept a frame.
    size_t minVoicedFrames = 8;     ///< Fewer accepted frames yields an "unknown" label.
    double monotoneSemitones = 1.8; ///< std below this is "monotone".
    double dynamicSemitones = 3.0;  ///< std at or above this is "dynamic".
};

/**
 * @brief Frame-wise F0 estimator using short-time autocorrelation.
 *
 * Each Hann-windowed frame is autocorrelated (FFTW), the strongest lag in the
 * plausible speaking range is taken as the period, and frames with weak
 * periodicity are rejected. Variation across accepted frames is measured in
 * semitones: std(log2(f0)) * 12.
 */
class PitchTracker : public core::IAnalyzer {
public:
    std::string getName() const override { return "Pitch"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override { m_config = PitchConfig{}; }

    /**
     * @brief Classifies pitch variation over the buffer.
     *
     * Degrades when the buffer is shorter than one frame or FFTW cannot plan.
     * Too few voiced frames is not a degradation: the result then carries the
     * "unknown" label together with the voiced-frame count.
     */
    core::Result<core::PitchResult> analyze(const core::AudioBuffer& audio) const;

    /**
     * @brief Maps a semitone standard deviation to a label.
     */
    core::PitchLabel classify(double stdSemitones) const;

    const PitchConfig& config() const { return m_config; }

private:
    PitchConfig m_config;

    bool track(const core::AudioBuffer& audio, std::vector<double>& pitches) const;
};

} // namespace dae::audio

#endif // DAE_AUDIO_PITCHTRACKER_H
