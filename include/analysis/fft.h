#pragma once

#include <vector>
#include <complex>
#include <memory>

namespace PulseAnalyzer {
namespace Analysis {

using Complex = std::complex<double>;
using ComplexBuffer = std::vector<Complex>;

/**
 * Radix-2 FFT (Cooley-Tukey, iterative). Size must be a power of 2.
 */
class FFT {
public:
    explicit FFT(int size);

    // In-place, unnormalized
    void forward(Complex* data) const;

    // In-place, normalized by 1/size
    void inverse(Complex* data) const;

    int getSize() const { return m_size; }

    static bool isPowerOfTwo(int n) { return n > 0 && (n & (n - 1)) == 0; }
    static int nextPowerOfTwo(int n);

private:
    int m_size;
    int m_log2Size;
    ComplexBuffer m_twiddleFactors;
    std::vector<int> m_bitReversed;

    void computeTwiddleFactors();
    void computeBitReversal();
    static int reverseBits(int x, int bits);
    void transform(Complex* data, bool inverse) const;
};

/**
 * DFT of real input, any length n >= 1.
 * Returns the n/2 + 1 non-redundant bins (the rest are conjugates).
 * Power-of-2 lengths use the FFT directly, other lengths go through
 * Bluestein's chirp-z on a padded power-of-2 FFT. O(n log n) both ways.
 */
class RealDFT {
public:
    explicit RealDFT(int size);

    ComplexBuffer forward(const std::vector<double>& input) const;

    int getSize() const { return m_size; }
    int getBinCount() const { return m_size / 2 + 1; }

    // |X[k]| for every bin
    static std::vector<double> magnitudes(const ComplexBuffer& bins);

private:
    int m_size;
    std::unique_ptr<FFT> m_fft;

    // Bluestein state (unused for power-of-2 sizes)
    ComplexBuffer m_chirp;              // exp(-i*pi*k^2/n), k < n
    ComplexBuffer m_chirpFilterSpectrum; // FFT of the conjugate chirp filter
};

} // namespace Analysis
} // namespace PulseAnalyzer
