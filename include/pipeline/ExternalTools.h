#ifndef DAE_PIPELINE_EXTERNALTOOLS_H
#define DAE_PIPELINE_EXTERNALTOOLS_H

#include <string>
#include "Collaborators.h"

namespace dae::pipeline {

/**
 * @brief Converts little-endian signed 16-bit PCM bytes to a mono buffer.
 */
core::AudioBuffer decodePcm16(const std::string& bytes, float sampleRate);

/**
 * @brief Audio decoder backed by the ffmpeg command-line tool.
 *
 * Extracts the first audio stream as 16-bit mono PCM at the requested rate.
 * Buffers shorter than 0.75s are rejected as too short for tonal analysis.
 */
class FfmpegAudioDecoder : public IAudioDecoder {
public:
    /**
     * @param binary Executable name looked up on PATH, or an explicit path.
     */
    explicit FfmpegAudioDecoder(const std::string& binary = "ffmpeg");

    core::Capability capability() const override { return m_capability; }
    core::Result<core::AudioBuffer> decode(const std::string& mediaPath, int sampleRate) override;

    /** @brief Decoded audio shorter than this is rejected. */
    static constexpr double kMinDurationSec = 0.75;
    /** @brief Characters of decoder stderr kept in a diagnostic note. */
    static constexpr size_t kMaxStderrChars = 120;

private:
    std::string m_executable;
    core::Capability m_capability;
};

/**
 * @brief Duration probe backed by the ffprobe command-line tool.
 */
class FfprobeDurationProbe : public IDurationProbe {
public:
    explicit FfprobeDurationProbe(const std::string& binary = "ffprobe");

    core::Capability capability() const override { return m_capability; }
    core::Result<double> probe(const std::string& mediaPath) override;

private:
    std::string m_executable;
    core::Capability m_capability;
};

} // namespace dae::pipeline

#endif // DAE_PIPELINE_EXTERNALTOOLS_H
