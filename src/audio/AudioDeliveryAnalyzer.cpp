#include "../../include/audio/AudioDeliveryAnalyzer.h"
#include <initializer_list>
#include <iostream>

namespace dae::audio {

bool AudioDeliveryAnalyzer::initialize(const nlohmann::json& config) {
    bool ok = true;
    for (core::IAnalyzer* analyzer : std::initializer_list<core::IAnalyzer*>{
             &m_pitch, &m_volume, &m_pauses, &m_sentences}) {
        const std::string name = analyzer->getName();
        if (!config.contains(name)) continue;
        if (!analyzer->initialize(config[name])) {
            std::cerr << "[Config] Invalid settings for '" << name << "'" << std::endl;
            ok = false;
        }
    }
    return ok;
}

void AudioDeliveryAnalyzer::reset() {
    m_pitch.reset();
    m_volume.reset();
    m_pauses.reset();
    m_sentences.reset();
}

AudioDeliveryReport AudioDeliveryAnalyzer::analyze(std::optional<core::AudioBuffer> audio,
                                                   const speech::WordTimeline& words,
                                                   double durationSeconds) const {
    AudioDeliveryReport report;
    report.metrics.silence = m_pauses.analyze(words);

    if (!audio || audio->empty()) {
        return report;
    }

    const core::AudioBuffer mono = audio->getChannelCount() == 1 ? std::move(*audio) : audio->toMono();
    audio.reset();

    auto pitch = m_pitch.analyze(mono);
    if (pitch) {
        report.metrics.monotone = pitch.value();
    } else {
        report.notes.push_back(pitch.reason());
    }

    auto volume = m_volume.analyze(mono, m_sentences.spans(words, durationSeconds));
    if (volume) {
        report.metrics.volume = volume.value();
    } else {
        report.notes.push_back(volume.reason());
    }

    if (pitch && report.metrics.monotone.label == core::PitchLabel::Unknown) {
        report.notes.emplace_back("Could not estimate pitch variation confidently for this recording.");
    }
    return report;
}

} // namespace dae::audio
