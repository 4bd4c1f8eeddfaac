#pragma once

#include <vector>

namespace PulseAnalyzer {
namespace Analysis {

/**
 * Normalizer - rescales a window into [0, 10] using its min/max.
 *
 * Every windowLength-th call recalibrates: the rescaled values are
 * clamped to block-averaged extrema (mean of per-block maxima/minima),
 * so a single outlier cannot compress the rest of the window.
 * A flat window maps to all zeros.
 */
class Normalizer {
public:
    static constexpr double SCALE = 10.0;

    explicit Normalizer(int windowLength, int blockSize = 10);

    std::vector<double> process(const std::vector<double>& values);

    // Plain rescale, no clamping
    static std::vector<double> rescale(const std::vector<double>& values);

    // Rescale and clamp to block-averaged extrema
    static std::vector<double> rescaleClamped(const std::vector<double>& values, int blockSize);

    // True if the next process() call recalibrates
    bool nextIsRecalibration() const;

    void reset() { m_invocations = 0; }

    long getInvocations() const { return m_invocations; }

private:
    int m_windowLength;
    int m_blockSize;
    long m_invocations;
};

} // namespace Analysis
} // namespace PulseAnalyzer
