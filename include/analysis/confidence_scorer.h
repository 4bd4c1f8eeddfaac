#pragma once

#include <vector>

namespace PulseAnalyzer {
namespace Analysis {

struct ConfidenceResult {
    bool valid;
    double weight;
    int peakCount;

    ConfidenceResult() : valid(false), weight(0.0), peakCount(0) {}
};

/**
 * How dominant the chosen bin is among all spectral peaks.
 *
 * A peak is a bin strictly above both neighbours (first and last bin
 * never qualify). weight = mag[dominant] / sum(mag[peaks]); a dominant
 * bin that is not a peak itself is added to the denominator, which keeps
 * the weight in [0, 1]. Near 1: one clear pulse frequency. Near
 * 1/peakCount: ambiguous spectrum.
 *
 * The weight is raw; squaring it for aggregation is up to the consumer.
 */
class ConfidenceScorer {
public:
    static std::vector<int> findPeaks(const std::vector<double>& magnitudes);

    // Invalid if there is nothing to compare against (no peaks, zero energy)
    static ConfidenceResult score(const std::vector<double>& magnitudes, int dominantBin);
};

} // namespace Analysis
} // namespace PulseAnalyzer
