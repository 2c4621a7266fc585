#ifndef DAE_AUDIO_AUTOCORRELATOR_H
#define DAE_AUDIO_AUTOCORRELATOR_H

#include <cstddef>
#include <vector>
#include <fftw3.h>

namespace dae::audio {

/**
 * @brief Linear (non-circular) autocorrelation of fixed-length frames via FFTW.
 *
 * Frames are zero-padded to a power of two >= 2 * frameSize, transformed,
 * squared in magnitude and transformed back (Wiener-Khinchin). One instance
 * owns its plan and buffers for the duration of one analysis call; the FFTW
 * planner itself is serialized across instances.
 */
class Autocorrelator {
public:
    explicit Autocorrelator(size_t frameSize);
    ~Autocorrelator();

    Autocorrelator(const Autocorrelator&) = delete;
    Autocorrelator& operator=(const Autocorrelator&) = delete;

    /**
     * @brief False when FFTW could not allocate buffers or create plans.
     */
    bool valid() const { return m_forward != nullptr && m_inverse != nullptr; }

    size_t frameSize() const { return m_frameSize; }

    /**
     * @brief Computes r[0..frameSize) for one frame.
     * @param frame Exactly frameSize() samples.
     * @param out Resized to frameSize(); out[k] = sum_i frame[i] * frame[i + k].
     */
    void compute(const std::vector<double>& frame, std::vector<double>& out);

private:
    size_t m_frameSize = 0;
    size_t m_fftSize = 0;
    double* m_time = nullptr;
    fftw_complex* m_spectrum = nullptr;  ///< m_fftSize / 2 + 1 bins
    fftw_plan m_forward = nullptr;
    fftw_plan m_inverse = nullptr;
};

} // namespace dae::audio

#endif // DAE_AUDIO_AUTOCORRELATOR_H
