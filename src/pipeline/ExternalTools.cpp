#include "../../include/pipeline/ExternalTools.h"
#include "../../include/pipeline/ProcessRunner.h"
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace dae::pipeline {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

core::Capability locate(const std::string& binary, std::string& executable, const std::string& missingReason) {
    if (auto path = ProcessRunner::findExecutable(binary)) {
        executable = *path;
        return core::Capability::yes();
    }
    return core::Capability::no(missingReason);
}

} // namespace

core::AudioBuffer decodePcm16(const std::string& bytes, float sampleRate) {
    const size_t count = bytes.size() / 2;
    std::vector<float> samples(count);
    for (size_t i = 0; i < count; ++i) {
        const auto lo = static_cast<uint8_t>(bytes[2 * i]);
        const auto hi = static_cast<uint8_t>(bytes[2 * i + 1]);
        const auto s = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        samples[i] = static_cast<float>(s) / 32768.0f;
    }
    return core::AudioBuffer::fromMono(std::move(samples), sampleRate);
}

// ============================================================================
// FfmpegAudioDecoder
// ============================================================================

FfmpegAudioDecoder::FfmpegAudioDecoder(const std::string& binary)
    : m_capability(locate(binary, m_executable, "ffmpeg not found. Audio tonal analysis was skipped.")) {
}

core::Result<core::AudioBuffer> FfmpegAudioDecoder::decode(const std::string& mediaPath, int sampleRate) {
    if (!m_capability.available) {
        return core::Result<core::AudioBuffer>::degraded(m_capability.reason);
    }

    const std::vector<std::string> argv = {
        m_executable, "-v", "error", "-i", mediaPath, "-vn",
        "-ac", "1", "-ar", std::to_string(sampleRate),
        "-f", "s16le", "-acodec", "pcm_s16le", "-"
    };

    ProcessOutput out;
    try {
        out = ProcessRunner::run(argv);
    } catch (const std::runtime_error& e) {
        return core::Result<core::AudioBuffer>::degraded(
            std::string("ffmpeg could not be started. Tonal analysis unavailable. (") + e.what() + ")");
    }

    if (out.exitCode != 0) {
        std::string reason = "ffmpeg failed during audio extraction. Tonal analysis unavailable.";
        const std::string err = trim(out.stderrData);
        if (!err.empty()) reason += " (" + err.substr(0, kMaxStderrChars) + ")";
        return core::Result<core::AudioBuffer>::degraded(reason);
    }
    if (out.stdoutData.empty()) {
        return core::Result<core::AudioBuffer>::degraded(
            "Audio extraction returned no samples. Tonal analysis was skipped.");
    }

    core::AudioBuffer buffer = decodePcm16(out.stdoutData, static_cast<float>(sampleRate));
    if (buffer.getFrameCount() < static_cast<size_t>(sampleRate * kMinDurationSec)) {
        return core::Result<core::AudioBuffer>::degraded(
            "Audio sample was too short for reliable tonal analysis.");
    }
    return buffer;
}

// ============================================================================
// FfprobeDurationProbe
// ============================================================================

FfprobeDurationProbe::FfprobeDurationProbe(const std::string& binary)
    : m_capability(locate(binary, m_executable, "ffprobe not found. Could not auto-detect media duration.")) {
}

core::Result<double> FfprobeDurationProbe::probe(const std::string& mediaPath) {
    if (!m_capability.available) {
        return core::Result<double>::degraded(m_capability.reason);
    }

    const std::vector<std::string> argv = {
        m_executable, "-v", "error", "-show_entries", "format=duration",
        "-of", "default=noprint_wrappers=1:nokey=1", mediaPath
    };

    try {
        const ProcessOutput out = ProcessRunner::run(argv);
        if (out.exitCode != 0) {
            return core::Result<double>::degraded("ffprobe failed to read media duration.");
        }
        const double duration = std::stod(trim(out.stdoutData));
        if (duration <= 0.0) {
            return core::Result<double>::degraded(
                "ffprobe returned non-positive duration. Could not auto-detect media duration.");
        }
        return duration;
    } catch (const std::invalid_argument&) {
        return core::Result<double>::degraded("ffprobe failed to read media duration.");
    } catch (const std::out_of_range&) {
        return core::Result<double>::degraded("ffprobe failed to read media duration.");
    } catch (const std::runtime_error& e) {
        return core::Result<double>::degraded(std::string("ffprobe could not be started: ") + e.what());
    }
}

} // namespace dae::pipeline
