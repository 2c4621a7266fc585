#pragma once

#include <vector>
#include <cstddef>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace dae::core {

/**
 * @brief Planar float audio buffer with sample-rate metadata.
 *
 * Samples are normalized to [-1, 1]. Decoders hand the analyzers a mono buffer;
 * multi-channel data only exists transiently while a file is being loaded.
 * The buffer is never mutated by the analyzers that receive it.
 */
class AudioBuffer {
public:
    /**
     * @brief Default constructor (empty buffer).
     */
    AudioBuffer() = default;

    /**
     * @brief Constructs a zeroed AudioBuffer with specified dimensions.
     *
     * @param channels The number of audio channels.
     * @param frames The number of sample frames per channel.
     * @param sampleRate The sample rate of the audio data in Hz (default is 16000).
     */
    AudioBuffer(size_t channels, size_t frames, float sampleRate = 16000.0f);

    /**
     * @brief Builds a mono buffer that takes ownership of the given samples.
     * @param samples Normalized mono samples.
     * @param sampleRate Sample rate in Hz.
     * @return The mono buffer.
     */
    static AudioBuffer fromMono(std::vector<float> samples, float sampleRate);

    // Data access
    /**
     * @brief Gets a pointer to the start of the specified channel's data.
     *
     * @param channel The index of the channel (0 to getChannelCount() - 1).
     * @return A pointer to the channel's float data, or nullptr when out of range.
     */
    float* getChannel(size_t channel);

    /**
     * @brief Gets a const pointer to the start of the specified channel's data.
     *
     * @param channel The index of the channel (0 to getChannelCount() - 1).
     * @return A const pointer to the channel's float data, or nullptr when out of range.
     */
    const float* getChannel(size_t channel) const;

    /**
     * @brief Creates and returns a mono mixdown of the buffer.
     * @return The per-frame average over all channels.
     */
    std::vector<float> getMono() const;

    /**
     * @brief Returns a buffer holding the mono mixdown of this one.
     */
    AudioBuffer toMono() const;

    // Properties
    size_t getChannelCount() const { return m_channels; }
    size_t getFrameCount() const { return m_frames; }
    float getSampleRate() const { return m_sampleRate; }
    bool empty() const { return m_frames == 0 || m_channels == 0; }

    /**
     * @brief Calculates the total duration of the buffer in seconds.
     * @return The duration in seconds, 0 when the sample rate is not positive.
     */
    double getDuration() const {
        return m_sampleRate > 0.0f ? m_frames / static_cast<double>(m_sampleRate) : 0.0;
    }

    /**
     * @brief Resamples the buffer to a new rate with linear interpolation.
     * @param targetRate The desired sample rate in Hz.
     * @return A new buffer at targetRate (a copy when rates already match).
     */
    AudioBuffer resampled(float targetRate) const;

    const float* data() const { return m_data.data(); }
    size_t dataSize() const { return m_data.size(); }

private:
    std::vector<float> m_data;
    size_t m_channels = 0;
    size_t m_frames = 0;
    float m_sampleRate = 16000.0f;
};

/**
 * @brief Frame-level helpers shared by the audio analyzers.
 */
namespace frame {

    /**
     * @brief Root-mean-square of samples[begin, end).
     * @return 0 for an empty range.
     */
    double rms(const float* samples, size_t begin, size_t end);

    /**
     * @brief Converts a linear RMS level to dBFS, flooring the level at 1e-7.
     */
    double toDbfs(double rms);
}

/**
 * @brief Window functions for short-time analysis.
 */
namespace window {

    /**
     * @brief Generates a symmetric Hann window.
     * @param size The number of points.
     * @return The window coefficients.
     */
    std::vector<double> hann(size_t size);
}

} // namespace dae::core
