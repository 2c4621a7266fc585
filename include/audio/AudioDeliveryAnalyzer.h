#ifndef DAE_AUDIO_AUDIODELIVERYANALYZER_H
#define DAE_AUDIO_AUDIODELIVERYANALYZER_H

#include <optional>
#include <string>
#include <vector>
#include "../core/IAnalyzer.h"
#include "../core/AudioBuffer.h"
#include "../core/AnalysisTypes.h"
#include "../speech/SentenceSpanner.h"
#include "../speech/WordTimeline.h"
#include "PitchTracker.h"
#include "VolumeProfiler.h"
#include "PauseClassifier.h"

namespace dae::audio {

/**
 * @brief Audio delivery metrics plus the notes explaining any degraded part.
 */
struct AudioDeliveryReport {
    core::AudioDeliveryMetrics metrics;
    std::vector<std::string> notes;
};

/**
 * @brief Composes pitch, volume and pause analysis into one aggregate.
 *
 * Pause classification only needs word timing and always runs. Pitch and
 * volume need decoded audio; without it they keep their "unknown" defaults.
 *
 * Configuration: {"Pitch": {...}, "Volume": {...}, "Pause": {...}, "Sentences": {...}}.
 */
class AudioDeliveryAnalyzer : public core::IAnalyzer {
public:
    std::string getName() const override { return "AudioDelivery"; }
    std::string getVersion() const override { return "1.0.0"; }
    bool initialize(const nlohmann::json& config) override;
    void reset() override;

    /**
     * @brief Analyzes one session. Never throws for missing or short audio.
     *
     * @param audio Decoded mono audio, or nullopt when decoding was unavailable.
     *              Consumed by this call.
     * @param words The session's word timeline.
     * @param durationSeconds Media duration used to clip sentence spans.
     */
    AudioDeliveryReport analyze(std::optional<core::AudioBuffer> audio,
                                const speech::WordTimeline& words,
                                double durationSeconds) const;

    const PitchTracker& pitch() const { return m_pitch; }
    const VolumeProfiler& volume() const { return m_volume; }
    const PauseClassifier& pauses() const { return m_pauses; }
    const speech::SentenceSpanner& sentences() const { return m_sentences; }

private:
    PitchTracker m_pitch;
    VolumeProfiler m_volume;
    PauseClassifier m_pauses;
    speech::SentenceSpanner m_sentences;
};

} // namespace dae::audio

#endif // DAE_AUDIO_AUDIODELIVERYANALYZER_H
