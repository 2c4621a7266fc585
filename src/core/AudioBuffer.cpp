#include "../../include/core/AudioBuffer.h"
#include <algorithm>
#include <cmath>

namespace dae::core {

// ============================================================================
// AudioBuffer Implementation
// ============================================================================

/**
 * @brief Constructs a zeroed planar buffer.
 */
AudioBuffer::AudioBuffer(size_t channels, size_t frames, float sampleRate)
    : m_data(channels * frames, 0.0f)
    , m_channels(channels)
    , m_frames(frames)
    , m_sampleRate(sampleRate) {
}

AudioBuffer AudioBuffer::fromMono(std::vector<float> samples, float sampleRate) {
    AudioBuffer buffer;
    buffer.m_frames = samples.size();
    buffer.m_channels = 1;
    buffer.m_sampleRate = sampleRate;
    buffer.m_data = std::move(samples);
    return buffer;
}

float* AudioBuffer::getChannel(size_t channel) {
    if (channel >= m_channels) {
        return nullptr;
    }
    return m_data.data() + channel * m_frames;
}

const float* AudioBuffer::getChannel(size_t channel) const {
    if (channel >= m_channels) {
        return nullptr;
    }
    return m_data.data() + channel * m_frames;
}

/**
 * @brief Averages all channels into one vector.
 * @return The mono mix, empty if the buffer is empty.
 */
std::vector<float> AudioBuffer::getMono() const {
    if (empty()) {
        return {};
    }

    if (m_channels == 1) {
        const float* channel = getChannel(0);
        return std::vector<float>(channel, channel + m_frames);
    }

    std::vector<float> mono(m_frames, 0.0f);
    for (size_t ch = 0; ch < m_channels; ++ch) {
        const float* channel = getChannel(ch);
        for (size_t i = 0; i < m_frames; ++i) {
            mono[i] += channel[i];
        }
    }

    const float scale = 1.0f / static_cast<float>(m_channels);
    for (float& sample : mono) {
        sample *= scale;
    }
    return mono;
}

AudioBuffer AudioBuffer::toMono() const {
    return fromMono(getMono(), m_sampleRate);
}

/**
 * @brief Linear-interpolation resampler.
 *
 * Speech analysis runs at 16 kHz; anti-aliasing is not applied because the
 * analyzers only look at content well below the new Nyquist frequency.
 */
AudioBuffer AudioBuffer::resampled(float targetRate) const {
    if (targetRate <= 0.0f || m_sampleRate <= 0.0f || empty() || targetRate == m_sampleRate) {
        AudioBuffer copy = *this;
        return copy;
    }

    const double ratio = static_cast<double>(m_sampleRate) / targetRate;
    const size_t outFrames = static_cast<size_t>(std::floor(m_frames / ratio));
    AudioBuffer out(m_channels, outFrames, targetRate);

    for (size_t ch = 0; ch < m_channels; ++ch) {
        const float* src = getChannel(ch);
        float* dst = out.getChannel(ch);
        for (size_t i = 0; i < outFrames; ++i) {
            const double pos = i * ratio;
            const size_t i0 = static_cast<size_t>(pos);
            const size_t i1 = std::min(i0 + 1, m_frames - 1);
            const double frac = pos - static_cast<double>(i0);
            dst[i] = static_cast<float>(src[i0] * (1.0 - frac) + src[i1] * frac);
        }
    }
    return out;
}

// ============================================================================
// Frame helpers
// ============================================================================

namespace frame {

double rms(const float* samples, size_t begin, size_t end) {
    if (!samples || end <= begin) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        const double s = samples[i];
        sum += s * s;
    }
    return std::sqrt(sum / static_cast<double>(end - begin));
}

double toDbfs(double rms) {
    return 20.0 * std::log10(std::max(rms, 1e-7));
}

} // namespace frame

// ============================================================================
// Window Functions Implementation
// ============================================================================

namespace window {

/**
 * @brief Hann window: 0.5 * (1 - cos(2*pi*i / (N-1))).
 */
std::vector<double> hann(size_t size) {
    std::vector<double> w(size, 1.0);
    if (size < 2) {
        return w;
    }
    for (size_t i = 0; i < size; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(size - 1);
        w[i] = 0.5 * (1.0 - std::cos(2.0 * M_PI * t));
    }
    return w;
}

} // namespace window

} // namespace dae::core
