#pragma once

#include "analysis/frequency_analyzer.h"
#include "analysis/fft.h"

namespace PulseAnalyzer {
namespace Analysis {

/**
 * Spectral strategy.
 *
 * Trims edgeCutoff samples from both ends, takes the real DFT of the rest
 * and picks the strongest bin above DC. The period comes from the real
 * elapsed time of the trimmed window, not a nominal sample rate:
 *   periodMs = (t[last] - t[first]) / dominantBin
 *   bpm      = 60000 / periodMs
 */
class SpectralAnalyzer : public FrequencyAnalyzer {
public:
    SpectralAnalyzer(int windowLength, int edgeCutoff);

    FrequencyEstimate analyze(const std::vector<double>& conditioned,
                              const std::vector<int64_t>& timestampsMs) const override;

    AnalysisStrategy strategy() const override { return AnalysisStrategy::Spectral; }

    int getTrimmedLength() const { return m_trimmedLength; }

    // Strongest bin in [1, end), lowest index wins ties. -1 if none.
    static int dominantBin(const std::vector<double>& magnitudes);

private:
    int m_windowLength;
    int m_edgeCutoff;
    int m_trimmedLength;
    RealDFT m_dft;
};

} // namespace Analysis
} // namespace PulseAnalyzer
