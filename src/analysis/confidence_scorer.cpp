#include "analysis/confidence_scorer.h"
#include <algorithm>

namespace PulseAnalyzer {
namespace Analysis {

std::vector<int> ConfidenceScorer::findPeaks(const std::vector<double>& magnitudes) {
    std::vector<int> peaks;
    const int n = static_cast<int>(magnitudes.size());
    for (int i = 1; i < n - 1; ++i) {
        if (magnitudes[i] > magnitudes[i - 1] && magnitudes[i] > magnitudes[i + 1]) {
            peaks.push_back(i);
        }
    }
    return peaks;
}

ConfidenceResult ConfidenceScorer::score(const std::vector<double>& magnitudes, int dominantBin) {
    ConfidenceResult result;
    if (dominantBin < 0 || dominantBin >= static_cast<int>(magnitudes.size())) {
        return result;
    }

    std::vector<int> peaks = findPeaks(magnitudes);
    result.peakCount = static_cast<int>(peaks.size());
    if (peaks.empty()) {
        return result;
    }

    double sum = 0.0;
    for (int p : peaks) sum += magnitudes[p];
    if (std::find(peaks.begin(), peaks.end(), dominantBin) == peaks.end()) {
        sum += magnitudes[dominantBin];
    }
    if (sum <= 0.0) {
        return result;
    }

    result.weight = std::min(1.0, std::max(0.0, magnitudes[dominantBin] / sum));
    result.valid = true;
    return result;
}

} // namespace Analysis
} // namespace PulseAnalyzer
