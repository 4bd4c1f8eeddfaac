#include "analysis/fft.h"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace PulseAnalyzer {
namespace Analysis {

namespace {
const double PI = 3.14159265358979323846;
}

// ============================================================================
// FFT Implementation (Cooley-Tukey Radix-2)
// ============================================================================

FFT::FFT(int size) : m_size(size), m_log2Size(0) {
    if (!isPowerOfTwo(size)) {
        throw std::invalid_argument("FFT size must be a power of 2 (got " +
                                    std::to_string(size) + ")");
    }

    int temp = size;
    while (temp > 1) {
        temp >>= 1;
        m_log2Size++;
    }

    computeTwiddleFactors();
    computeBitReversal();
}

int FFT::nextPowerOfTwo(int n) {
    int p = 1;
    while (p < n) p <<= 1;
    return p;
}

void FFT::computeTwiddleFactors() {
    m_twiddleFactors.resize(m_size / 2);

    for (int i = 0; i < m_size / 2; ++i) {
        double angle = -2.0 * PI * i / m_size;
        m_twiddleFactors[i] = Complex(std::cos(angle), std::sin(angle));
    }
}

void FFT::computeBitReversal() {
    m_bitReversed.resize(m_size);
    for (int i = 0; i < m_size; ++i) {
        m_bitReversed[i] = reverseBits(i, m_log2Size);
    }
}

int FFT::reverseBits(int x, int bits) {
    int result = 0;
    for (int i = 0; i < bits; ++i) {
        result = (result << 1) | (x & 1);
        x >>= 1;
    }
    return result;
}

void FFT::transform(Complex* data, bool inverse) const {
    // Bit-reversal permutation (swap each pair once)
    for (int i = 0; i < m_size; ++i) {
        int j = m_bitReversed[i];
        if (j > i) std::swap(data[i], data[j]);
    }

    for (int stage = 1; stage <= m_log2Size; ++stage) {
        int m = 1 << stage;
        int halfM = m / 2;
        int step = m_size / m;

        for (int k = 0; k < m_size; k += m) {
            for (int j = 0; j < halfM; ++j) {
                Complex w = m_twiddleFactors[j * step];
                if (inverse) w = std::conj(w);
                Complex t = w * data[k + j + halfM];
                Complex u = data[k + j];
                data[k + j] = u + t;
                data[k + j + halfM] = u - t;
            }
        }
    }
}

void FFT::forward(Complex* data) const {
    transform(data, false);
}

void FFT::inverse(Complex* data) const {
    transform(data, true);
    for (int i = 0; i < m_size; ++i) {
        data[i] /= static_cast<double>(m_size);
    }
}

// ============================================================================
// Real-input DFT, arbitrary length
// ============================================================================

RealDFT::RealDFT(int size) : m_size(size) {
    if (size <= 0) {
        throw std::invalid_argument("DFT size must be positive (got " +
                                    std::to_string(size) + ")");
    }

    if (FFT::isPowerOfTwo(size)) {
        m_fft = std::make_unique<FFT>(size);
        return;
    }

    // Bluestein: X[k] = c[k] * sum_t (x[t] c[t]) conj(c[k - t]),
    // c[k] = exp(-i*pi*k^2/n). The sum is a linear convolution,
    // done as a circular one of length >= 2n - 1.
    const int n = size;
    const int m = FFT::nextPowerOfTwo(2 * n - 1);
    m_fft = std::make_unique<FFT>(m);

    m_chirp.resize(n);
    for (int k = 0; k < n; ++k) {
        // k^2 mod 2n keeps the angle small for large k
        long long k2 = (static_cast<long long>(k) * k) % (2LL * n);
        double angle = -PI * static_cast<double>(k2) / n;
        m_chirp[k] = Complex(std::cos(angle), std::sin(angle));
    }

    m_chirpFilterSpectrum.assign(m, Complex(0.0, 0.0));
    m_chirpFilterSpectrum[0] = std::conj(m_chirp[0]);
    for (int k = 1; k < n; ++k) {
        m_chirpFilterSpectrum[k] = std::conj(m_chirp[k]);
        m_chirpFilterSpectrum[m - k] = std::conj(m_chirp[k]);
    }
    m_fft->forward(m_chirpFilterSpectrum.data());
}

ComplexBuffer RealDFT::forward(const std::vector<double>& input) const {
    if (static_cast<int>(input.size()) != m_size) {
        throw std::invalid_argument("DFT input has " + std::to_string(input.size()) +
                                    " samples, expected " + std::to_string(m_size));
    }

    const int bins = getBinCount();
    ComplexBuffer out(bins);

    if (m_chirp.empty()) {
        ComplexBuffer data(m_size);
        for (int i = 0; i < m_size; ++i) data[i] = Complex(input[i], 0.0);
        m_fft->forward(data.data());
        for (int k = 0; k < bins; ++k) out[k] = data[k];
        return out;
    }

    const int m = m_fft->getSize();
    ComplexBuffer a(m, Complex(0.0, 0.0));
    for (int t = 0; t < m_size; ++t) {
        a[t] = input[t] * m_chirp[t];
    }

    m_fft->forward(a.data());
    for (int i = 0; i < m; ++i) {
        a[i] *= m_chirpFilterSpectrum[i];
    }
    m_fft->inverse(a.data());

    for (int k = 0; k < bins; ++k) {
        out[k] = a[k] * m_chirp[k];
    }
    return out;
}

std::vector<double> RealDFT::magnitudes(const ComplexBuffer& bins) {
    std::vector<double> mags(bins.size());
    for (size_t k = 0; k < bins.size(); ++k) {
        mags[k] = std::sqrt(bins[k].real() * bins[k].real() +
                            bins[k].imag() * bins[k].imag());
    }
    return mags;
}

} // namespace Analysis
} // namespace PulseAnalyzer
