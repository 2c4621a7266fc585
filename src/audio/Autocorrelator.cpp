#include "../../include/audio/Autocorrelator.h"
#include <algorithm>
#include <mutex>

namespace dae::audio {

namespace {

// Only fftw_execute is thread-safe; planning and plan destruction are not.
std::mutex& plannerMutex() {
    static std::mutex m;
    return m;
}

size_t nextPowerOfTwo(size_t n) {
    size_t p = 1;
    while (p < n) p <<= 1;
    return p;
}

} // namespace

Autocorrelator::Autocorrelator(size_t frameSize)
    : m_frameSize(frameSize)
    , m_fftSize(nextPowerOfTwo(std::max<size_t>(2, 2 * frameSize))) {
    m_time = static_cast<double*>(fftw_malloc(sizeof(double) * m_fftSize));
    m_spectrum = static_cast<fftw_complex*>(fftw_malloc(sizeof(fftw_complex) * (m_fftSize / 2 + 1)));
    if (!m_time || !m_spectrum) return;

    std::lock_guard<std::mutex> lock(plannerMutex());
    const int n = static_cast<int>(m_fftSize);
    m_forward = fftw_plan_dft_r2c_1d(n, m_time, m_spectrum, FFTW_ESTIMATE);
    m_inverse = fftw_plan_dft_c2r_1d(n, m_spectrum, m_time, FFTW_ESTIMATE);
}

Autocorrelator::~Autocorrelator() {
    {
        std::lock_guard<std::mutex> lock(plannerMutex());
        if (m_forward) fftw_destroy_plan(m_forward);
        if (m_inverse) fftw_destroy_plan(m_inverse);
    }
    if (m_time) fftw_free(m_time);
    if (m_spectrum) fftw_free(m_spectrum);
}

void Autocorrelator::compute(const std::vector<double>& frame, std::vector<double>& out) {
    out.assign(m_frameSize, 0.0);
    if (!valid()) return;

    const size_t n = std::min(frame.size(), m_frameSize);
    std::copy(frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(n), m_time);
    std::fill(m_time + n, m_time + m_fftSize, 0.0);

    fftw_execute(m_forward);

    // Power spectrum; the c2r transform of |X|^2 is the autocorrelation.
    const size_t bins = m_fftSize / 2 + 1;
    for (size_t k = 0; k < bins; ++k) {
        const double re = m_spectrum[k][0];
        const double im = m_spectrum[k][1];
        m_spectrum[k][0] = re * re + im * im;
        m_spectrum[k][1] = 0.0;
    }

    fftw_execute(m_inverse);

    // FFTW's inverse is unnormalized.
    const double scale = 1.0 / static_cast<double>(m_fftSize);
    for (size_t k = 0; k < m_frameSize; ++k) {
        out[k] = m_time[k] * scale;
    }
}

} // namespace dae::audio
