#include <iostream>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../include/core/AudioBuffer.h"
#include "../include/audio/PitchTracker.h"
#include "../include/audio/VolumeProfiler.h"
#include "../include/audio/AudioDeliveryAnalyzer.h"
#include "../include/pipeline/ExternalTools.h"
#include "../include/pipeline/AudioLoader.h"

using dae::core::AudioBuffer;

static AudioBuffer synth_tone(double freqHz, double durSec, double amp, float sr = 16000.0f) {
    std::vector<float> samples(static_cast<size_t>(durSec * sr));
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<float>(amp * std::sin(2.0 * M_PI * freqHz * i / sr));
    }
    return AudioBuffer::fromMono(std::move(samples), sr);
}

// Exponential sweep from f0 to f1, so the pitch is spread evenly in semitones.
static AudioBuffer synth_log_sweep(double f0, double f1, double durSec, double amp, float sr = 16000.0f) {
    std::vector<float> samples(static_cast<size_t>(durSec * sr));
    double phase = 0.0;
    for (size_t i = 0; i < samples.size(); ++i) {
        const double t = i / static_cast<double>(sr);
        const double f = f0 * std::pow(f1 / f0, t / durSec);
        samples[i] = static_cast<float>(amp * std::sin(phase));
        phase += 2.0 * M_PI * f / sr;
    }
    return AudioBuffer::fromMono(std::move(samples), sr);
}

// Minimal 16-bit mono RIFF/WAV with the given header rate.
static void write_wav(const std::string& path, uint32_t sampleRate, const std::vector<int16_t>& samples) {
    auto u32 = [](std::string& out, uint32_t v) {
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
    };
    auto u16 = [](std::string& out, uint16_t v) {
        out.push_back(static_cast<char>(v & 0xFF));
        out.push_back(static_cast<char>((v >> 8) & 0xFF));
    };
    const uint32_t dataSize = static_cast<uint32_t>(samples.size() * 2);
    std::string bytes = "RIFF";
    u32(bytes, 36 + dataSize);
    bytes += "WAVEfmt ";
    u32(bytes, 16);
    u16(bytes, 1);
    u16(bytes, 1);
    u32(bytes, sampleRate);
    u32(bytes, sampleRate * 2);
    u16(bytes, 2);
    u16(bytes, 16);
    bytes += "data";
    u32(bytes, dataSize);
    for (int16_t v : samples) u16(bytes, static_cast<uint16_t>(v));
    std::ofstream f(path, std::ios::binary);
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

bool test_pitch_constant_tone_is_monotone() {
    dae::audio::PitchTracker pitch;
    auto result = pitch.analyze(synth_tone(150.0, 2.0, 0.5));
    if (!result) {
        std::cerr << "Pitch degraded: " << result.reason() << std::endl;
        return false;
    }
    const auto& r = result.value();
    std::cout << "Constant tone -> mean " << r.meanHz << " Hz, std " << r.stdSemitones << " st" << std::endl;
    if (r.voicedFrames < 8) return false;
    if (std::abs(r.meanHz - 150.0) > 3.0) {
        std::cerr << "Mean pitch off: " << r.meanHz << std::endl;
        return false;
    }
    return r.label == dae::core::PitchLabel::Monotone && r.isMonotone();
}

bool test_pitch_sweep_is_dynamic() {
    dae::audio::PitchTracker pitch;
    auto result = pitch.analyze(synth_log_sweep(100.0, 250.0, 4.0, 0.5));
    if (!result) {
        std::cerr << "Pitch degraded: " << result.reason() << std::endl;
        return false;
    }
    const auto& r = result.value();
    std::cout << "Sweep -> std " << r.stdSemitones << " st over " << r.voicedFrames << " frames" << std::endl;
    return r.label == dae::core::PitchLabel::Dynamic && r.stdSemitones >= 3.0;
}

bool test_pitch_silence_and_short_audio_are_unknown() {
    dae::audio::PitchTracker pitch;
    AudioBuffer silence(1, 32000, 16000.0f);
    auto quiet = pitch.analyze(silence);
    if (!quiet || quiet.value().label != dae::core::PitchLabel::Unknown || quiet.value().voicedFrames != 0) {
        std::cerr << "Silence must be unknown with no voiced frames" << std::endl;
        return false;
    }

    auto tooShort = pitch.analyze(synth_tone(150.0, 0.02, 0.5));
    return !tooShort.ok() && !tooShort.reason().empty();
}

bool test_volume_trailing_off_is_inconsistent() {
    const float sr = 16000.0f;
    const double sentenceSec = 2.0;
    std::vector<float> samples(static_cast<size_t>(3 * sentenceSec * sr));
    std::vector<dae::core::SentenceSpan> spans;
    for (int s = 0; s < 3; ++s) {
        const size_t begin = static_cast<size_t>(s * sentenceSec * sr);
        const size_t len = static_cast<size_t>(sentenceSec * sr);
        const size_t tailStart = begin + static_cast<size_t>(0.7 * len);
        for (size_t i = begin; i < begin + len; ++i) {
            const double gain = i >= tailStart ? 0.3 : 1.0;
            samples[i] = static_cast<float>(0.5 * gain * std::sin(2.0 * M_PI * 180.0 * i / sr));
        }
        spans.push_back({s * sentenceSec, (s + 1) * sentenceSec});
    }

    dae::audio::VolumeProfiler volume;
    auto result = volume.analyze(AudioBuffer::fromMono(std::move(samples), sr), spans);
    if (!result) {
        std::cerr << "Volume degraded: " << result.reason() << std::endl;
        return false;
    }
    const auto& r = result.value();
    std::cout << "Volume -> mean " << r.meanDbfs << " dBFS, trailing " << r.trailingOffEvents << std::endl;
    if (r.trailingOffEvents <= 0 || r.tooQuiet) return false;
    if (r.trailingOffExamples.empty() || r.trailingOffExamples.front().ratio >= 0.62) return false;
    return r.consistency == dae::core::VolumeLabel::Inconsistent;
}

bool test_volume_quiet_buffer_is_too_quiet() {
    dae::audio::VolumeProfiler volume;
    auto result = volume.analyze(synth_tone(200.0, 2.0, 0.005), {});
    if (!result) return false;
    const auto& r = result.value();
    return r.tooQuiet && r.consistency == dae::core::VolumeLabel::TooQuiet && r.trailingOffRatio == 0.0;
}

bool test_audio_delivery_without_audio_keeps_unknown_shape() {
    std::vector<dae::core::WordToken> words = {
        {"Okay.", 0.0, 0.4, 0}, {"Let's", 1.2, 1.5, 1}, {"start", 1.5, 1.9, 2}
    };
    dae::audio::AudioDeliveryAnalyzer analyzer;
    auto report = analyzer.analyze(std::nullopt, dae::speech::WordTimeline(words), 5.0);

    const auto& m = report.metrics;
    if (m.monotone.label != dae::core::PitchLabel::Unknown) return false;
    if (m.volume.consistency != dae::core::VolumeLabel::Unknown) return false;
    // Pause classification only needs word timing.
    return m.silence.effectivePauses == 1 && m.silence.quality == dae::core::PauseQuality::Effective;
}

bool test_audio_delivery_rejects_invalid_config() {
    dae::audio::AudioDeliveryAnalyzer analyzer;
    nlohmann::json bad = {{"Pitch", {{"minHz", 400.0}, {"maxHz", 100.0}}}};
    if (analyzer.initialize(bad)) return false;

    analyzer.reset();
    nlohmann::json good = {{"Pitch", {{"monotoneSemitones", 1.0}}}, {"Volume", {{"tooQuietDbfs", -40.0}}}};
    if (!analyzer.initialize(good)) return false;
    return analyzer.pitch().config().monotoneSemitones == 1.0 && analyzer.volume().config().tooQuietDbfs == -40.0;
}

bool test_decode_pcm16_normalizes_samples() {
    std::string bytes;
    for (int16_t v : {int16_t(0), int16_t(16384), int16_t(-32768)}) {
        bytes.push_back(static_cast<char>(v & 0xFF));
        bytes.push_back(static_cast<char>((v >> 8) & 0xFF));
    }
    AudioBuffer buffer = dae::pipeline::decodePcm16(bytes, 16000.0f);
    if (buffer.getFrameCount() != 3 || buffer.getChannelCount() != 1) return false;
    const float* s = buffer.getChannel(0);
    return s[0] == 0.0f && std::abs(s[1] - 0.5f) < 1e-6f && std::abs(s[2] + 1.0f) < 1e-6f;
}

bool test_wav_loader_rejects_zero_sample_rate() {
    const auto path = (std::filesystem::temp_directory_path() / "dae_test_zero_rate.wav").string();
    write_wav(path, 0, std::vector<int16_t>(1600, 1000));

    bool rejected = false;
    try {
        dae::pipeline::AudioLoader::loadWav(path);
    } catch (const std::runtime_error& e) {
        rejected = std::string(e.what()).find("sample rate") != std::string::npos;
    }
    dae::pipeline::WavAudioDecoder decoder;
    auto decoded = decoder.decode(path, 16000);

    write_wav(path, 8000, std::vector<int16_t>(8000, 16384));
    auto valid = decoder.decode(path, 16000);
    std::filesystem::remove(path);

    if (!rejected || decoded.ok()) {
        std::cerr << "A zero sample rate must be rejected" << std::endl;
        return false;
    }
    return valid.ok() && valid.value().getFrameCount() == 16000
        && valid.value().getSampleRate() == 16000.0f;
}
