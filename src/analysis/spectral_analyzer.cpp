#include "analysis/spectral_analyzer.h"
#include "analysis/confidence_scorer.h"
#include <string>

namespace PulseAnalyzer {
namespace Analysis {

SpectralAnalyzer::SpectralAnalyzer(int windowLength, int edgeCutoff)
    : m_windowLength(windowLength),
      m_edgeCutoff(edgeCutoff),
      m_trimmedLength(windowLength - 2 * edgeCutoff),
      m_dft(windowLength - 2 * edgeCutoff) {
}

int SpectralAnalyzer::dominantBin(const std::vector<double>& magnitudes) {
    int best = -1;
    for (int k = 1; k < static_cast<int>(magnitudes.size()); ++k) {
        if (best < 0 || magnitudes[k] > magnitudes[best]) {
            best = k;
        }
    }
    return best;
}

FrequencyEstimate SpectralAnalyzer::analyze(const std::vector<double>& conditioned,
                                            const std::vector<int64_t>& timestampsMs) const {
    if (static_cast<int>(conditioned.size()) != m_windowLength ||
        timestampsMs.size() != conditioned.size()) {
        return FrequencyEstimate::none("window has " + std::to_string(conditioned.size()) +
                                       " samples, expected " + std::to_string(m_windowLength));
    }

    // Edges are distorted by the detrend edge replication
    const int first = m_edgeCutoff;
    const int last = m_windowLength - m_edgeCutoff - 1;
    std::vector<double> trimmed(conditioned.begin() + first, conditioned.begin() + last + 1);

    ComplexBuffer bins = m_dft.forward(trimmed);
    std::vector<double> mags = RealDFT::magnitudes(bins);

    if (static_cast<int>(mags.size()) < m_trimmedLength / 2 + 1) {
        return FrequencyEstimate::none("not enough spectral bins");
    }

    FrequencyEstimate est;
    est.magnitudes = mags;
    est.spectrum.reserve(mags.size());
    for (size_t k = 0; k < mags.size(); ++k) {
        est.spectrum.emplace_back(timestampsMs[first + k], mags[k]);
    }

    int dominant = dominantBin(mags);
    if (dominant < 1) {
        est.reason = "no bin above DC";
        return est;
    }
    est.dominantBin = dominant;

    double durationMs = static_cast<double>(timestampsMs[last] - timestampsMs[first]);
    if (durationMs <= 0.0) {
        est.reason = "trimmed window has no duration";
        return est;
    }

    ConfidenceResult confidence = ConfidenceScorer::score(mags, dominant);
    if (!confidence.valid) {
        est.reason = "degenerate spectrum (" + std::to_string(confidence.peakCount) + " peaks)";
        return est;
    }

    double periodMs = durationMs / dominant;
    est.bpm = 60000.0 / periodMs;
    est.weight = confidence.weight;
    est.valid = true;
    return est;
}

} // namespace Analysis
} // namespace PulseAnalyzer
